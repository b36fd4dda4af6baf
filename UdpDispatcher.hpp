#if !defined UDP_DISPATCHER_HPP
#define UDP_DISPATCHER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class Log;
class UdpSocket;

// Sends single datagrams, each on its own short-lived broadcast-enabled socket
class UdpDispatcher
{
public:

    // How long a socket is held open after a send before it is closed.  Closing immediately
    // after sendto() returns can drop the still-queued datagram on some platforms.
    static const std::chrono::milliseconds DEFAULT_CLOSE_GRACE_PERIOD;

    explicit UdpDispatcher(
        Log&                             log,
        const std::chrono::milliseconds& close_grace_period = DEFAULT_CLOSE_GRACE_PERIOD);

    virtual ~UdpDispatcher();

    // Sends payload as one datagram to address:port.  Returns true only if the whole payload
    // was accepted by the transport.  Never throws; failures are logged.
    virtual bool send(const std::vector<std::uint8_t>& payload,
                      const std::string&               address,
                      std::uint16_t                    port);

    const std::chrono::milliseconds& getCloseGracePeriod() const;

protected:

    // Returns a new, unopened socket owned by the caller
    virtual UdpSocket* createSocket();

    Log& log;

private:

    std::chrono::milliseconds close_grace_period;

    UdpDispatcher(const UdpDispatcher&);
    UdpDispatcher& operator=(const UdpDispatcher&);
};

#endif
