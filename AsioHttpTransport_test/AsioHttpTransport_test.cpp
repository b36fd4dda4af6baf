#include <chrono>
#include <cstdint>
#include <iostream>
#include <istream>
#include <iterator>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/http.hpp>

#include "AsioHttpTransport_test.hpp"

#include "AsioHttpTransport.hpp"
#include "CancellationToken.hpp"
#include "HttpMessage.hpp"
#include "HttpTransport.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(AsioHttpTransport_test);

namespace
{
    namespace http = boost::beast::http;

    using boost::asio::ip::tcp;

    const HttpTimeouts short_timeouts(std::chrono::milliseconds(300),
                                      std::chrono::milliseconds(2000));

    // Loopback listener answering exactly one connection from a background thread
    class OneShotServer
    {
    public:

        OneShotServer() :
            acceptor(io_context),
            listening(false)
        {
            boost::system::error_code ec;
            acceptor.open(tcp::v4(), ec);
            if (!ec)
            {
                acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0), ec);
            }
            if (!ec)
            {
                acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
            }

            if (ec)
            {
                std::cout << "Cannot listen on loopback: " << ec.message() << "\n";
                return;
            }

            listening = true;
        }

        ~OneShotServer()
        {
            join();
        }

        // Reads the request head and answers with reply.  An empty reply means hold the
        // connection open, silent, for hold_time.
        void serve(const std::string& reply, const std::chrono::milliseconds& hold_time)
        {
            server = std::thread(&OneShotServer::serveOnce, this, reply, hold_time);
        }

        void join()
        {
            if (server.joinable())
            {
                server.join();
            }
        }

        void close()
        {
            boost::system::error_code ec;
            acceptor.close(ec);
        }

        bool isListening() const
        {
            return listening;
        }

        std::uint16_t getPort() const
        {
            return acceptor.local_endpoint().port();
        }

        // Request head as the server saw it; valid after join()
        std::string received;

    private:

        void serveOnce(std::string reply, std::chrono::milliseconds hold_time)
        {
            boost::system::error_code ec;
            tcp::socket socket(io_context);
            acceptor.accept(socket, ec);
            if (ec)
            {
                return;
            }

            boost::asio::streambuf request_buffer;
            boost::asio::read_until(socket, request_buffer, "\r\n\r\n", ec);
            if (!ec)
            {
                std::istream request_stream(&request_buffer);
                received.assign(std::istreambuf_iterator<char>(request_stream),
                                std::istreambuf_iterator<char>());
            }

            if (reply.empty())
            {
                std::this_thread::sleep_for(hold_time);
            }
            else
            {
                boost::asio::write(socket, boost::asio::buffer(reply), ec);
            }

            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }

        boost::asio::io_context io_context;

        tcp::acceptor acceptor;

        bool listening;

        std::thread server;
    };

    HttpRequest makeWakeRequest()
    {
        HttpRequest request(http::verb::post, "/wol", 11);
        request.set(http::field::content_type, "application/json");
        request.body() = "{\"mac\":\"00:1B:63:84:45:E6\"}";
        return request;
    }

    // Runs one exchange against server with short timeouts
    HttpTransport::Outcome exchange(OneShotServer&   server,
                                    HttpResponse&    response,
                                    std::string&     error)
    {
        AsioHttpTransport transport;
        CancellationToken cancellation;
        return transport.perform("127.0.0.1",
                                 server.getPort(),
                                 makeWakeRequest(),
                                 short_timeouts,
                                 cancellation,
                                 response,
                                 error);
    }
}

//==============================================================================
void AsioHttpTransport_test::addTestCases()
{
    ADD_TEST_CASE(CompleteExchange);
    ADD_TEST_CASE(SilentServerTimesOut);
    ADD_TEST_CASE(Cancellation);
    ADD_TEST_CASE(NotHttp);
    ADD_TEST_CASE(ChunkedDataWithoutCrlfRejected);
    ADD_TEST_CASE(ConnectionRefused);
}

//==============================================================================
Test::Result AsioHttpTransport_test::CompleteExchange::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    server.serve("HTTP/1.1 202 Accepted\r\n"
                 "Content-Type: application/json\r\n"
                 "Content-Length: 17\r\n\r\n{\"status\":\"sent\"}",
                 std::chrono::milliseconds(0));

    HttpResponse response;
    std::string error;
    HttpTransport::Outcome outcome = exchange(server, response, error);
    server.join();

    if (outcome != HttpTransport::COMPLETED)
    {
        std::cout << error << "\n";
        return Test::FAILED;
    }

    if (response.result_int() != 202 || response.body() != "{\"status\":\"sent\"}")
    {
        return Test::FAILED;
    }

    if (server.received.find("POST /wol HTTP/1.1\r\n") != 0 ||
        server.received.find("Content-Length: 27\r\n") == std::string::npos)
    {
        std::cout << server.received << "\n";
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result AsioHttpTransport_test::SilentServerTimesOut::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    server.serve("", std::chrono::milliseconds(1500));

    HttpResponse response;
    std::string error;
    const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    HttpTransport::Outcome outcome = exchange(server, response, error);
    const std::chrono::steady_clock::duration elapsed =
        std::chrono::steady_clock::now() - start;
    server.join();

    if (outcome != HttpTransport::TIMED_OUT || elapsed >= std::chrono::milliseconds(1500))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result AsioHttpTransport_test::Cancellation::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    server.serve("", std::chrono::milliseconds(1500));

    CancellationToken cancellation;
    std::thread canceller([&cancellation]()
                          {
                              std::this_thread::sleep_for(std::chrono::milliseconds(100));
                              cancellation.cancel();
                          });

    AsioHttpTransport transport;
    HttpResponse response;
    std::string error;
    const HttpTimeouts long_timeouts(std::chrono::milliseconds(10000),
                                     std::chrono::milliseconds(20000));
    HttpTransport::Outcome outcome = transport.perform("127.0.0.1",
                                                       server.getPort(),
                                                       makeWakeRequest(),
                                                       long_timeouts,
                                                       cancellation,
                                                       response,
                                                       error);
    canceller.join();
    server.join();

    return outcome == HttpTransport::CANCELLED ? Test::PASSED : Test::FAILED;
}

//==============================================================================
Test::Result AsioHttpTransport_test::NotHttp::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    server.serve("garbage\r\n\r\n", std::chrono::milliseconds(0));

    HttpResponse response;
    std::string error;
    HttpTransport::Outcome outcome = exchange(server, response, error);
    server.join();

    return outcome == HttpTransport::MALFORMED_RESPONSE ? Test::PASSED : Test::FAILED;
}

//==============================================================================
// A chunk must be followed by CRLF; trailing bytes in its place aren't body data
//==============================================================================
Test::Result AsioHttpTransport_test::ChunkedDataWithoutCrlfRejected::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    server.serve("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhelloXX0\r\n\r\n",
                 std::chrono::milliseconds(0));

    HttpResponse response;
    std::string error;
    HttpTransport::Outcome outcome = exchange(server, response, error);
    server.join();

    if (outcome != HttpTransport::MALFORMED_RESPONSE)
    {
        std::cout << "Outcome " << outcome << ", body \"" << response.body() << "\"\n";
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result AsioHttpTransport_test::ConnectionRefused::body()
{
    OneShotServer server;
    if (!server.isListening())
    {
        return Test::SKIPPED;
    }

    const std::uint16_t port = server.getPort();
    server.close();

    AsioHttpTransport transport;
    CancellationToken cancellation;
    HttpResponse response;
    std::string error;
    HttpTransport::Outcome outcome = transport.perform("127.0.0.1",
                                                       port,
                                                       makeWakeRequest(),
                                                       short_timeouts,
                                                       cancellation,
                                                       response,
                                                       error);

    if (outcome != HttpTransport::CONNECTION_FAILED || error.empty())
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}
