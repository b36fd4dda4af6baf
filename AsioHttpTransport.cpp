#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "AsioHttpTransport.hpp"

#include "CancellationToken.hpp"
#include "HttpMessage.hpp"

const std::chrono::milliseconds AsioHttpTransport::POLL_PERIOD(20);
const std::size_t AsioHttpTransport::MAX_RESPONSE_SIZE = 1024 * 1024;

namespace
{
    namespace http = boost::beast::http;

    // Errors raised by the HTTP parser because of what the server sent.  A connection closed
    // before any of the response arrived is a connection failure instead.
    bool isProtocolError(const boost::system::error_code& ec)
    {
        return ec.category() == http::make_error_code(http::error::bad_version).category() &&
            ec != http::error::end_of_stream;
    }
}
//=============================================================================================
AsioHttpTransport::AsioHttpTransport()
{
}

//=============================================================================================
AsioHttpTransport::~AsioHttpTransport()
{
}

//=============================================================================================
// Resolves, connects, writes the request and reads until a whole response has arrived, all
// asynchronously on a local io_context
//=============================================================================================
HttpTransport::Outcome AsioHttpTransport::perform(const std::string&       host,
                                                  std::uint16_t            port,
                                                  const HttpRequest&       request,
                                                  const HttpTimeouts&      timeouts,
                                                  const CancellationToken& cancellation,
                                                  HttpResponse&            response,
                                                  std::string&             error)
{
    using boost::asio::ip::tcp;

    // Declared first so it is destroyed last, taking any never-run handlers with it
    boost::asio::io_context io_context;
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);

    std::ostringstream host_header;
    host_header << host << ":" << port;

    // Must outlive the asynchronous write
    HttpRequest outgoing(request);
    outgoing.set(http::field::host, host_header.str());
    outgoing.keep_alive(false);
    outgoing.prepare_payload();

    boost::beast::flat_buffer read_buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_SIZE);

    bool done = false;
    Outcome outcome = CONNECTION_FAILED;

    const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point last_progress = start;

    // Ends the exchange; only the first call has any effect
    std::function<void(Outcome, const std::string&)> finish =
        [&](Outcome finished_outcome, const std::string& message)
        {
            if (done)
            {
                return;
            }

            done    = true;
            outcome = finished_outcome;
            error   = message;

            boost::system::error_code ignored;
            resolver.cancel();
            socket.shutdown(tcp::socket::shutdown_both, ignored);
            socket.close(ignored);
        };

    std::function<void(const boost::system::error_code&, std::size_t)> on_read =
        [&](const boost::system::error_code& ec, std::size_t bytes_read)
        {
            if (done)
            {
                return;
            }

            if (bytes_read > 0)
            {
                last_progress = std::chrono::steady_clock::now();
            }

            if (ec == http::error::body_limit)
            {
                finish(MALFORMED_RESPONSE, "Response too large");
                return;
            }

            if (isProtocolError(ec))
            {
                finish(MALFORMED_RESPONSE, "Malformed response: " + ec.message());
                return;
            }

            if (ec)
            {
                finish(CONNECTION_FAILED, "Read failed: " + ec.message());
                return;
            }

            if (parser.is_done())
            {
                response = parser.release();
                finish(COMPLETED, "");
                return;
            }

            http::async_read_some(socket, read_buffer, parser, on_read);
        };

    resolver.async_resolve(
        host,
        std::to_string(port),
        [&](const boost::system::error_code& ec, tcp::resolver::results_type endpoints)
        {
            if (done)
            {
                return;
            }

            if (ec)
            {
                finish(CONNECTION_FAILED, "Could not resolve " + host + ": " + ec.message());
                return;
            }

            last_progress = std::chrono::steady_clock::now();

            boost::asio::async_connect(
                socket,
                endpoints,
                [&](const boost::system::error_code& ec, const tcp::endpoint&)
                {
                    if (done)
                    {
                        return;
                    }

                    if (ec)
                    {
                        finish(CONNECTION_FAILED,
                               "Could not connect to " + host_header.str() + ": " +
                               ec.message());
                        return;
                    }

                    last_progress = std::chrono::steady_clock::now();

                    http::async_write(
                        socket,
                        outgoing,
                        [&](const boost::system::error_code& ec, std::size_t)
                        {
                            if (done)
                            {
                                return;
                            }

                            if (ec)
                            {
                                finish(CONNECTION_FAILED, "Write failed: " + ec.message());
                                return;
                            }

                            last_progress = std::chrono::steady_clock::now();

                            http::async_read_some(socket, read_buffer, parser, on_read);
                        });
                });
        });

    while (!done)
    {
        const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

        if (cancellation.isCancelled())
        {
            finish(CANCELLED, "Request cancelled");
        }
        else if (now - start >= timeouts.resource)
        {
            finish(TIMED_OUT,
                   "Exchange with " + host_header.str() + " exceeded its time limit");
        }
        else if (now - last_progress >= timeouts.request)
        {
            finish(TIMED_OUT,
                   "No progress from " + host_header.str() + " within the request timeout");
        }
        else
        {
            io_context.run_for(POLL_PERIOD);

            if (io_context.stopped())
            {
                if (!done)
                {
                    finish(CONNECTION_FAILED,
                           "Exchange with " + host_header.str() + " stalled");
                }
            }
        }
    }

    return outcome;
}
