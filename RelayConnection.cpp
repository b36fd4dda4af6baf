#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "RelayConnection.hpp"

#include "HttpMessage.hpp"
#include "Log.hpp"
#include "RelayRequestHandler.hpp"

const std::chrono::seconds RelayConnection::READ_TIMEOUT(10);

namespace
{
    namespace http = boost::beast::http;

    // The request arrived, at least in part, but isn't valid HTTP
    bool isMalformedRequest(const boost::system::error_code& ec)
    {
        return ec.category() == http::make_error_code(http::error::bad_version).category() &&
            ec != http::error::end_of_stream &&
            ec != http::error::partial_message;
    }
}

//=============================================================================================
RelayConnection::RelayConnection(boost::asio::ip::tcp::socket socket,
                                 RelayRequestHandler&         handler,
                                 boost::asio::thread_pool&    workers,
                                 Log&                         log) :
    socket(std::move(socket)),
    read_timer(this->socket.get_executor()),
    handler(handler),
    workers(workers),
    log(log)
{
    boost::system::error_code ec;
    boost::asio::ip::tcp::endpoint remote_endpoint = this->socket.remote_endpoint(ec);
    remote_address = ec ? std::string("unknown") : remote_endpoint.address().to_string();

    parser.header_limit(MAX_HEADER_SIZE);
    parser.body_limit(handler.getConfig().max_request_size);
}

//=============================================================================================
RelayConnection::~RelayConnection()
{
}

//=============================================================================================
void RelayConnection::start()
{
    std::shared_ptr<RelayConnection> self(shared_from_this());

    read_timer.expires_after(READ_TIMEOUT);
    read_timer.async_wait(
        [this, self](const boost::system::error_code& ec)
        {
            // Cancellation means the request arrived in time
            if (ec != boost::asio::error::operation_aborted)
            {
                log.write("ERROR - Dropping connection from " + remote_address +
                          ", request not received in time");
                close();
            }
        });

    http::async_read(
        socket,
        read_buffer,
        parser,
        [this, self](const boost::system::error_code& ec, std::size_t)
        {
            onRead(ec);
        });
}

//=============================================================================================
void RelayConnection::onRead(const boost::system::error_code& ec)
{
    read_timer.cancel();

    if (ec == http::error::body_limit)
    {
        // Only the head has been read
        respond(handler.handleOversized(parser.get(), remote_address));
        return;
    }

    if (isMalformedRequest(ec))
    {
        respond(handler.handleMalformed(remote_address, ec.message()));
        return;
    }

    if (ec)
    {
        // The peer went away or the read timer closed the socket
        close();
        return;
    }

    HttpResponse immediate_response;
    WakeOrder order;
    if (handler.handle(parser.get(), remote_address, immediate_response, order))
    {
        respond(immediate_response);
        return;
    }

    deliver(order);
}

//=============================================================================================
// Sends the magic packets on a worker thread so the connection thread stays free for other
// clients, then comes back to this connection's executor to answer
//=============================================================================================
void RelayConnection::deliver(const WakeOrder& order)
{
    std::shared_ptr<RelayConnection> self(shared_from_this());

    boost::asio::post(
        workers,
        [this, self, order]()
        {
            const HttpResponse delivered = handler.deliver(order);

            boost::asio::post(socket.get_executor(),
                              [this, self, delivered]()
                              {
                                  respond(delivered);
                              });
        });
}

//=============================================================================================
void RelayConnection::respond(const HttpResponse& response)
{
    this->response = response;

    std::shared_ptr<RelayConnection> self(shared_from_this());

    http::async_write(
        socket,
        this->response,
        [this, self](const boost::system::error_code& ec, std::size_t)
        {
            if (ec)
            {
                log.write("ERROR - Could not send response to " + remote_address + ": " +
                          ec.message());
            }

            close();
        });
}

//=============================================================================================
void RelayConnection::close()
{
    if (!socket.is_open())
    {
        return;
    }

    boost::system::error_code ignored;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}
