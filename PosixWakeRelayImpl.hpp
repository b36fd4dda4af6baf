#if !defined POSIX_WAKE_RELAY_IMPL_HPP
#define POSIX_WAKE_RELAY_IMPL_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "WakeRelayImpl.hpp"

#include "LocalDelivery.hpp"
#include "Log.hpp"
#include "RelayListener.hpp"
#include "RelayRequestHandler.hpp"
#include "UdpDispatcher.hpp"

class PosixWakeRelayImpl : public WakeRelayImpl
{
public:

    PosixWakeRelayImpl(
        int                             argc,
        char**                          argv,
        const std::chrono::nanoseconds& period,
        const std::chrono::nanoseconds& tolerance =
        std::chrono::nanoseconds(static_cast<unsigned int>(1e8)));

    virtual ~PosixWakeRelayImpl();

    virtual void step();

    virtual std::uint16_t getPort() const;

    virtual const RelayCounters& getCounters() const;

protected:

    // Delivered signals handled here
    virtual void processDeliveredSignals();

private:

    // Opens the log file; used after log rotation and during startup
    void openLog();

    // Closes the log file; used before log rotation and on shutdown
    void closeLog();

    // Frees resources and triggers program shutdown at the end of the current frame
    void shutdown();

    void addInterfaceBroadcastAddresses();

    // Threads in the workers pool
    static const std::size_t DELIVERY_THREADS = 1;

    static void writePidToFile(const std::string& filename);

    // Used to log relay activity
    Log log;

    // Log messages go out on this stream
    std::ofstream log_stream;

    // Sends the magic packets
    UdpDispatcher udp_dispatcher;

    std::unique_ptr<LocalDelivery> local_delivery;

    std::unique_ptr<RelayRequestHandler> request_handler;

    // Destroyed after the listener and before anything its connections refer to
    boost::asio::io_context io_context;

    // Delivers magic packets so the io_context is never blocked by a wake
    boost::asio::thread_pool workers;

    std::unique_ptr<RelayListener> listener;

    // False once shutdown() has run
    bool running;
};

#endif
