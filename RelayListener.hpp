#if !defined RELAY_LISTENER_HPP
#define RELAY_LISTENER_HPP

#include <cstdint>
#include <string>

#include <boost/asio.hpp>

class Log;
class RelayRequestHandler;

// Accepts relay gateway connections on an io_context owned by the caller and hands each one to
// a RelayConnection
class RelayListener
{
public:

    // Wakes are delivered on workers
    RelayListener(boost::asio::io_context&  io_context,
                  RelayRequestHandler&      handler,
                  boost::asio::thread_pool& workers,
                  Log&                      log);

    ~RelayListener();

    // Binds and starts accepting.  A port of 0 picks an ephemeral port.
    bool open(const std::string& listen_address, std::uint16_t port, std::string& error);

    void close();

    // The port actually bound, 0 if not open
    std::uint16_t getPort() const;

private:

    void accept();

    boost::asio::ip::tcp::acceptor acceptor;

    RelayRequestHandler& handler;

    boost::asio::thread_pool& workers;

    Log& log;

    RelayListener(const RelayListener&);
    RelayListener& operator=(const RelayListener&);
};

#endif
