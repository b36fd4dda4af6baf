#if !defined NETWORK_ADDRESSES_HPP
#define NETWORK_ADDRESSES_HPP

#include <string>
#include <vector>

#include "MacAddress.hpp"

namespace networkAddresses
{
    // True for a strict dotted-quad IPv4 address (four decimal octets, no leading zeros)
    bool isValidIpv4(const std::string& address);

    // True for an RFC 1123 hostname
    bool isValidHostname(const std::string& hostname);

    // Relay-side MAC policy; rejects addresses made of a single repeated hex digit, which
    // covers the all-zero and broadcast addresses
    bool isUsableWakeAddress(const MacAddress& mac_address);

    // Relay-side target IP policy; a valid IPv4 address that isn't unspecified, loopback or
    // the limited broadcast address
    bool isUsableTargetIpv4(const std::string& address);

    // Collects the directed broadcast address of every IPv4 interface that is up, isn't a
    // loopback and supports broadcast.  Duplicates are dropped.
    bool getInterfaceBroadcastAddresses(std::vector<std::string>& broadcast_addresses,
                                        std::string&              error);
}

#endif
