#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "RelayListener.hpp"

#include "Log.hpp"
#include "RelayConnection.hpp"
#include "RelayRequestHandler.hpp"

//=============================================================================================
RelayListener::RelayListener(boost::asio::io_context&  io_context,
                             RelayRequestHandler&      handler,
                             boost::asio::thread_pool& workers,
                             Log&                      log) :
    acceptor(io_context),
    handler(handler),
    workers(workers),
    log(log)
{
}

//=============================================================================================
RelayListener::~RelayListener()
{
    close();
}

//=============================================================================================
bool RelayListener::open(const std::string& listen_address,
                         std::uint16_t      port,
                         std::string&       error)
{
    using boost::asio::ip::tcp;

    boost::system::error_code ec;

    const boost::asio::ip::address address = boost::asio::ip::make_address(listen_address, ec);
    if (ec)
    {
        error = "Invalid listen address " + listen_address + ": " + ec.message();
        return false;
    }

    const tcp::endpoint endpoint(address, port);

    std::ostringstream endpoint_name;
    endpoint_name << listen_address << ":" << port;

    acceptor.open(endpoint.protocol(), ec);
    if (!ec)
    {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec)
    {
        acceptor.bind(endpoint, ec);
    }
    if (!ec)
    {
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }

    if (ec)
    {
        error = "Cannot listen on " + endpoint_name.str() + ": " + ec.message();

        boost::system::error_code ignored;
        acceptor.close(ignored);
        return false;
    }

    std::ostringstream listening_message;
    listening_message << "Listening on " << listen_address << ":" << getPort();
    log.write(listening_message.str());

    accept();
    return true;
}

//=============================================================================================
void RelayListener::close()
{
    if (acceptor.is_open())
    {
        boost::system::error_code ignored;
        acceptor.close(ignored);
    }
}

//=============================================================================================
std::uint16_t RelayListener::getPort() const
{
    if (!acceptor.is_open())
    {
        return 0;
    }

    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint endpoint = acceptor.local_endpoint(ec);

    return ec ? 0 : endpoint.port();
}

//=============================================================================================
void RelayListener::accept()
{
    acceptor.async_accept(
        [this](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket)
        {
            if (ec == boost::asio::error::operation_aborted || !acceptor.is_open())
            {
                return;
            }

            if (ec)
            {
                log.write("ERROR - Accept failed: " + ec.message());
            }
            else
            {
                std::make_shared<RelayConnection>(
                    std::move(socket), handler, workers, log)->start();
            }

            accept();
        });
}
