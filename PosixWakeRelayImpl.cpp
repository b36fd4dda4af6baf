// This program relays Wake-on-LAN requests.  Authenticated clients on other networks ask it
// over HTTP to wake a device, and it broadcasts the magic packet on the network it is on.

#include <csignal>
#include <cstdint>
#include <fstream>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include <boost/asio.hpp>

#include "PosixWakeRelayImpl.hpp"

#include "LocalDelivery.hpp"
#include "Log.hpp"
#include "NetworkAddresses.hpp"
#include "RelayListener.hpp"
#include "RelayRequestHandler.hpp"
#include "SignalManager.hpp"

//=============================================================================================
PosixWakeRelayImpl::PosixWakeRelayImpl(int                             argc,
                                       char**                          argv,
                                       const std::chrono::nanoseconds& period,
                                       const std::chrono::nanoseconds& tolerance) :
    WakeRelayImpl(argc, argv, period, tolerance),
    udp_dispatcher(log),
    workers(DELIVERY_THREADS),
    running(false)
{
    // -d has to be known before the default file is read
    findDefaultFile();

    // Read configuration settings
    if (!processDefaultFile(default_filename))
    {
        throw std::runtime_error("Cannot process default file");
    }

    // Process arguments; these override the default file
    if (!processArguments())
    {
        throw std::runtime_error("Cannot process arguments");
    }

    // Initialize the output stream to be used for log file writing
    openLog();

    local_delivery.reset(new LocalDelivery(udp_dispatcher, log, config.broadcast_address));

    if (config.interface_broadcast)
    {
        addInterfaceBroadcastAddresses();
    }

    request_handler.reset(new RelayRequestHandler(*local_delivery, log, config));

    listener.reset(new RelayListener(io_context, *request_handler, workers, log));

    std::string error;
    if (!listener->open(config.listen_address,
                        static_cast<std::uint16_t>(config.port),
                        error))
    {
        log.write("ERROR - " + error);
        closeLog();
        throw std::runtime_error(error);
    }

    // Write our PID to file
    writePidToFile(pid_filename);

    // Register signals to handle
    SignalManager* signal_manager = getSignalManager();
    signal_manager->registerSignal(SIGINT);
    signal_manager->registerSignal(SIGTERM);
    signal_manager->registerSignal(SIGUSR1);
    signal_manager->registerSignal(SIGUSR2);

    if (config.api_key.empty())
    {
        log.write("No API key configured, requests will not be authenticated");
    }

    running = true;

    // Note that the service has started
    log.write("Service starting");
}

//=============================================================================================
PosixWakeRelayImpl::~PosixWakeRelayImpl()
{
    shutdown();
}

//=============================================================================================
std::uint16_t PosixWakeRelayImpl::getPort() const
{
    return listener->getPort();
}

//=============================================================================================
const RelayCounters& PosixWakeRelayImpl::getCounters() const
{
    return request_handler->getCounters();
}

//=============================================================================================
// Body of the main loop, executed periodically and indefinitely
//=============================================================================================
void PosixWakeRelayImpl::step()
{
    // Run whatever network work is ready without blocking
    if (io_context.stopped())
    {
        io_context.restart();
    }
    io_context.poll();

    // It's possible for this to run shutdown(), which closes the listener and the log.  Let's
    // handle signals here, so if we do indeed shutdown we do so after this frame has used
    // them.
    processDeliveredSignals();
}

//=============================================================================================
// Delivered signals handled here
//=============================================================================================
void PosixWakeRelayImpl::processDeliveredSignals()
{
    SignalManager* signal_manager = getSignalManager();

    if (signal_manager->isSignalDelivered(SIGUSR1))
    {
        // Logrotate uses this
        closeLog();
    }

    if (signal_manager->isSignalDelivered(SIGUSR2))
    {
        // Logrotate uses this
        openLog();
    }

    if (signal_manager->isSignalDelivered(SIGINT) ||
        signal_manager->isSignalDelivered(SIGTERM))
    {
        shutdown();
    }
}

//=============================================================================================
// Opens the log file; used after log rotation and during startup
//=============================================================================================
void PosixWakeRelayImpl::openLog()
{
    log_stream.open(log_filename.c_str(), std::ofstream::app);

    log.setOutputStream(log_stream);
    log.flushAfterWrite(true);
    log.useLocalTime();

    log.write("Log file open");
}

//=============================================================================================
// Closes the log file; used before log rotation and on shutdown
//=============================================================================================
void PosixWakeRelayImpl::closeLog()
{
    log.write("Closing log file");
    log_stream.close();
}

//=============================================================================================
// Frees resources and triggers program shutdown at the end of the current frame
//=============================================================================================
void PosixWakeRelayImpl::shutdown()
{
    if (!running)
    {
        return;
    }
    running = false;

    // Log that the service is stopping
    log.write("Service stopping");

    // No new connections past this point
    listener->close();

    // Wakes already accepted finish before the log goes away
    workers.join();

    closeLog();

    // Delete the PID file
    unlink(pid_filename.c_str());

    // Signal that we should stop running
    setTerminate(true);
}

//=============================================================================================
// Adds the subnet broadcast address of every local interface to the delivery destinations
//=============================================================================================
void PosixWakeRelayImpl::addInterfaceBroadcastAddresses()
{
    std::vector<std::string> broadcast_addresses;
    std::string error;

    if (!networkAddresses::getInterfaceBroadcastAddresses(broadcast_addresses, error))
    {
        log.write("ERROR - Interface broadcast addresses unavailable: " + error);
        return;
    }

    for (std::vector<std::string>::const_iterator i = broadcast_addresses.begin();
         i != broadcast_addresses.end();
         ++i)
    {
        if (*i != local_delivery->getBroadcastAddress())
        {
            local_delivery->addBroadcastAddress(*i);
            log.write("Also broadcasting to " + *i);
        }
    }
}

//=============================================================================================
void PosixWakeRelayImpl::writePidToFile(const std::string& filename)
{
    std::ofstream out_stream(filename.c_str());
    out_stream << getpid() << "\n";
    out_stream.close();
}
