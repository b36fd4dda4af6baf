#if !defined WAKE_TARGET_HPP
#define WAKE_TARGET_HPP

#include <string>

#include "MacAddress.hpp"

// A device that can be woken
struct WakeTarget
{
    WakeTarget();

    WakeTarget(const std::string& name,
               const std::string& ip_address,
               const std::string& mac_address);

    // Checks the MAC address parses and that the IP address, if given, is a dotted-quad IPv4
    // address.  On success the parsed MAC address is stored in mac.
    bool validate(MacAddress& mac, std::string& error) const;

    // Display only
    std::string name;

    // Optional; used for directed delivery and passed on to relays
    std::string ip_address;

    std::string mac_address;
};

#endif
