// Sends one Wake-on-LAN request, either straight onto the local network or through a relay
// gateway, and reports how it went.

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "AsioHttpTransport.hpp"
#include "CancellationToken.hpp"
#include "DispatchLog.hpp"
#include "LocalDelivery.hpp"
#include "Log.hpp"
#include "NetworkAddresses.hpp"
#include "RelayClient.hpp"
#include "RetryPolicy.hpp"
#include "UdpDispatcher.hpp"
#include "WakeDispatcher.hpp"
#include "WakeSettings.hpp"

namespace
{
    // Set while a wake is in progress
    CancellationToken* volatile cancellation = 0;

    void cancelOnSignal(int)
    {
        CancellationToken* const token = cancellation;
        if (token)
        {
            token->cancel();
        }
    }

    bool registerCancelSignal(int signal_number)
    {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = cancelOnSignal;
        sigemptyset(&action.sa_mask);

        return sigaction(signal_number, &action, 0) == 0;
    }
}

int main(int argc, char** argv)
{
    std::vector<std::string> arguments(argv + 1, argv + argc);

    WakeSettings settings;
    std::string error;
    if (!settings.load(arguments, error))
    {
        std::cerr << error << "\n" << WakeSettings::getUsage();
        return 1;
    }

    Log log;
    std::ofstream log_stream;
    if (settings.log_filename.empty())
    {
        log.setOutputStream(std::cout);
    }
    else
    {
        log_stream.open(settings.log_filename.c_str(), std::ofstream::app);
        if (log_stream.fail())
        {
            std::cerr << "Cannot open log file " << settings.log_filename << "\n";
            return 1;
        }

        log.setOutputStream(log_stream);
    }
    log.flushAfterWrite(true);
    log.useLocalTime();

    if (!registerCancelSignal(SIGINT) || !registerCancelSignal(SIGTERM))
    {
        log.write(std::string("ERROR - Cannot register signal handlers: ") +
                  std::strerror(errno));
        return 1;
    }

    std::unique_ptr<CancellationToken> cancellation_token;
    try
    {
        cancellation_token.reset(new CancellationToken());
    }
    catch (std::runtime_error& ex)
    {
        log.write(std::string("ERROR - ") + ex.what());
        return 1;
    }
    cancellation = cancellation_token.get();

    int return_code = 1;

    try
    {
        UdpDispatcher udp_dispatcher(log);
        LocalDelivery local_delivery(udp_dispatcher, log);

        if (settings.interface_broadcast)
        {
            std::vector<std::string> broadcast_addresses;
            if (networkAddresses::getInterfaceBroadcastAddresses(broadcast_addresses, error))
            {
                for (std::vector<std::string>::const_iterator i = broadcast_addresses.begin();
                     i != broadcast_addresses.end();
                     ++i)
                {
                    if (*i != local_delivery.getBroadcastAddress())
                    {
                        local_delivery.addBroadcastAddress(*i);
                    }
                }
            }
            else
            {
                log.write("ERROR - Interface broadcast addresses unavailable: " + error);
            }
        }

        AsioHttpTransport http_transport;
        RetryPolicy retry_policy;
        RelayClient relay_client(http_transport, retry_policy, log);

        WakeDispatcher wake_dispatcher(local_delivery, relay_client, log);

        DispatchAttempt attempt =
            wake_dispatcher.sendWake(settings.target, settings.relay, *cancellation_token);

        std::cout << wake_dispatcher.getStatus() << "\n";

        std::vector<DispatchAttempt> history = wake_dispatcher.getDispatchLog().getEntries();
        for (std::vector<DispatchAttempt>::const_iterator i = history.begin();
             i != history.end();
             ++i)
        {
            std::cout << "  " << i->toString() << "\n";
        }

        return_code = attempt.success ? 0 : 1;
    }
    catch (std::exception& ex)
    {
        log.write(std::string("ERROR - ") + ex.what());
    }

    cancellation = 0;

    return return_code;
}
