#include <cstddef>
#include <exception>
#include <sstream>
#include <string>

#include "WakeDispatcher.hpp"

#include "MacAddress.hpp"

#include "CancellationToken.hpp"
#include "DispatchLog.hpp"
#include "LocalDelivery.hpp"
#include "Log.hpp"
#include "RelayClient.hpp"
#include "RelayConfig.hpp"
#include "WakeTarget.hpp"

//=============================================================================================
WakeDispatcher::WakeDispatcher(LocalDelivery& local_delivery,
                               RelayClient&   relay_client,
                               Log&           log,
                               std::size_t    log_capacity) :
    local_delivery(local_delivery),
    relay_client(relay_client),
    log(log),
    dispatch_log(log_capacity)
{
}

//=============================================================================================
WakeDispatcher::~WakeDispatcher()
{
}

//=============================================================================================
DispatchAttempt WakeDispatcher::sendWake(const WakeTarget&        target,
                                         const RelayConfig&       relay,
                                         const CancellationToken& cancellation)
{
    const std::string method =
        relay.enabled ? DispatchAttempt::METHOD_RELAY : DispatchAttempt::METHOD_LOCAL;

    // Nothing goes on the network for a request that can't be valid
    MacAddress mac_address;
    std::string error;
    if (!target.validate(mac_address, error))
    {
        log.write("ERROR - Invalid device " + target.name + ": " + error);
        return record(DispatchAttempt(method, false, "Invalid device: " + error));
    }

    if (relay.enabled && !relay.validate(error))
    {
        log.write("ERROR - Invalid relay configuration: " + error);
        return record(DispatchAttempt(method, false, "Invalid relay configuration: " + error));
    }

    if (!relay.enabled)
    {
        return record(sendLocal(mac_address, target.ip_address));
    }

    bool cancelled = false;
    DispatchAttempt relay_attempt =
        record(sendRelay(target, relay, cancellation, cancelled));

    if (relay_attempt.success || cancelled || !relay.fallback_local)
    {
        return relay_attempt;
    }

    log.write("Relay delivery failed, falling back to local delivery");
    return record(sendLocal(mac_address, target.ip_address));
}

//=============================================================================================
const DispatchLog& WakeDispatcher::getDispatchLog() const
{
    return dispatch_log;
}

//=============================================================================================
std::string WakeDispatcher::getStatus() const
{
    DispatchAttempt latest;
    if (!dispatch_log.getLatest(latest))
    {
        return std::string();
    }

    return latest.message;
}

//=============================================================================================
DispatchAttempt WakeDispatcher::sendLocal(const MacAddress&  mac_address,
                                          const std::string& target_ip)
{
    try
    {
        DeliveryReport report = local_delivery.dispatch(mac_address, target_ip);

        std::ostringstream message;
        if (report.succeeded())
        {
            message << "Wake-on-LAN sent locally (" << report.success_count << "/"
                    << report.total_attempts << " packets)";
        }
        else
        {
            message << "Local delivery failed, no magic packets sent ("
                    << report.total_attempts << " attempts)";
        }

        return DispatchAttempt(DispatchAttempt::METHOD_LOCAL,
                               report.succeeded(),
                               message.str());
    }
    catch (std::exception& ex)
    {
        log.write(std::string("ERROR - Local delivery aborted: ") + ex.what());
        return DispatchAttempt(DispatchAttempt::METHOD_LOCAL,
                               false,
                               std::string("Local delivery error: ") + ex.what());
    }
}

//=============================================================================================
DispatchAttempt WakeDispatcher::sendRelay(const WakeTarget&        target,
                                          const RelayConfig&       relay,
                                          const CancellationToken& cancellation,
                                          bool&                    cancelled)
{
    try
    {
        RelayClient::Outcome outcome = relay_client.dispatch(target, relay, cancellation);
        cancelled = outcome.cancelled;

        return DispatchAttempt(DispatchAttempt::METHOD_RELAY,
                               outcome.success,
                               outcome.message,
                               outcome.http_status);
    }
    catch (std::exception& ex)
    {
        cancelled = cancellation.isCancelled();

        log.write(std::string("ERROR - Relay delivery aborted: ") + ex.what());
        return DispatchAttempt(DispatchAttempt::METHOD_RELAY,
                               false,
                               std::string("Relay error: ") + ex.what());
    }
}

//=============================================================================================
DispatchAttempt WakeDispatcher::record(const DispatchAttempt& attempt)
{
    dispatch_log.append(attempt);
    return attempt;
}
