#if !defined LOCAL_DELIVERY_HPP
#define LOCAL_DELIVERY_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "MacAddress.hpp"

class Log;
class UdpDispatcher;

// Tally of one local dispatch.  UDP delivery can't be confirmed end-to-end, so a dispatch is
// considered successful if any single send went out.
struct DeliveryReport
{
    DeliveryReport();

    bool succeeded() const;

    unsigned int success_count;

    unsigned int total_attempts;
};

// Issues a magic packet straight onto the local network
class LocalDelivery
{
public:

    // IANA-assigned Wake-on-LAN port
    static const std::uint16_t WOL_PORT = 9;

    // Legacy port some network stacks still listen on
    static const std::uint16_t LEGACY_WOL_PORT = 7;

    static const char* const GLOBAL_BROADCAST_ADDRESS;

    LocalDelivery(UdpDispatcher&     dispatcher,
                  Log&               log,
                  const std::string& broadcast_address = GLOBAL_BROADCAST_ADDRESS);

    ~LocalDelivery();

    // Extra broadcast destinations (typically per-interface subnet broadcasts), sent after the
    // standard destinations on both ports
    void addBroadcastAddress(const std::string& broadcast_address);

    // Sends to the broadcast address on port 9 then port 7, then, if target_ip is non-empty,
    // directly to target_ip on port 9 then port 7.  Every send is attempted regardless of how
    // the others went.
    DeliveryReport dispatch(const MacAddress& mac_address, const std::string& target_ip);

    const std::string& getBroadcastAddress() const;

private:

    UdpDispatcher& dispatcher;

    Log& log;

    std::string broadcast_address;

    std::vector<std::string> extra_broadcast_addresses;

    LocalDelivery(const LocalDelivery&);
    LocalDelivery& operator=(const LocalDelivery&);
};

#endif
