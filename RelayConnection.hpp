#if !defined RELAY_CONNECTION_HPP
#define RELAY_CONNECTION_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "HttpMessage.hpp"
#include "RelayRequestHandler.hpp"

class Log;

// One accepted client connection.  Reads a single request, writes the handler's response and
// closes; a connection that doesn't deliver a whole request within READ_TIMEOUT is dropped.
// Wakes are delivered on the workers pool and their response is written back on the
// connection's own executor.  Lifetime is held by the pending asynchronous operations through
// shared_from_this().
class RelayConnection : public std::enable_shared_from_this<RelayConnection>
{
public:

    static const std::chrono::seconds READ_TIMEOUT;

    // Longest request line plus headers accepted
    static const std::size_t MAX_HEADER_SIZE = 8192;

    RelayConnection(boost::asio::ip::tcp::socket socket,
                    RelayRequestHandler&         handler,
                    boost::asio::thread_pool&    workers,
                    Log&                         log);

    ~RelayConnection();

    void start();

private:

    void onRead(const boost::system::error_code& ec);

    void deliver(const WakeOrder& order);

    void respond(const HttpResponse& response);

    void close();

    boost::asio::ip::tcp::socket socket;

    boost::asio::steady_timer read_timer;

    RelayRequestHandler& handler;

    boost::asio::thread_pool& workers;

    Log& log;

    std::string remote_address;

    boost::beast::flat_buffer read_buffer;

    boost::beast::http::request_parser<boost::beast::http::string_body> parser;

    // Must outlive the asynchronous write
    HttpResponse response;

    RelayConnection(const RelayConnection&);
    RelayConnection& operator=(const RelayConnection&);
};

#endif
