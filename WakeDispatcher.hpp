#if !defined WAKE_DISPATCHER_HPP
#define WAKE_DISPATCHER_HPP

#include <cstddef>
#include <string>

#include "MacAddress.hpp"

#include "DispatchLog.hpp"

class CancellationToken;
class LocalDelivery;
class Log;
class RelayClient;
struct RelayConfig;
struct WakeTarget;

// Decides how a wake request is delivered.  With relay mode on the relay client is used, and
// if it fails for any reason other than cancellation and fallback is enabled, the magic packet
// is then delivered locally.  Every attempt is recorded in a bounded dispatch log.
class WakeDispatcher
{
public:

    WakeDispatcher(LocalDelivery& local_delivery,
                   RelayClient&   relay_client,
                   Log&           log,
                   std::size_t    log_capacity = DispatchLog::DEFAULT_CAPACITY);

    ~WakeDispatcher();

    // Returns the last attempt recorded for this request
    DispatchAttempt sendWake(const WakeTarget&        target,
                             const RelayConfig&       relay,
                             const CancellationToken& cancellation);

    const DispatchLog& getDispatchLog() const;

    // Message of the most recent attempt, empty if nothing has been sent
    std::string getStatus() const;

private:

    DispatchAttempt sendLocal(const MacAddress&  mac_address,
                              const std::string& target_ip);

    DispatchAttempt sendRelay(const WakeTarget&        target,
                              const RelayConfig&       relay,
                              const CancellationToken& cancellation,
                              bool&                    cancelled);

    DispatchAttempt record(const DispatchAttempt& attempt);

    LocalDelivery& local_delivery;

    RelayClient& relay_client;

    Log& log;

    DispatchLog dispatch_log;

    WakeDispatcher(const WakeDispatcher&);
    WakeDispatcher& operator=(const WakeDispatcher&);
};

#endif
