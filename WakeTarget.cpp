#include <string>

#include "WakeTarget.hpp"

#include "MacAddress.hpp"
#include "MacAddressText.hpp"
#include "NetworkAddresses.hpp"

//=============================================================================================
WakeTarget::WakeTarget()
{
}

//=============================================================================================
WakeTarget::WakeTarget(const std::string& name,
                       const std::string& ip_address,
                       const std::string& mac_address) :
    name(name),
    ip_address(ip_address),
    mac_address(mac_address)
{
}

//=============================================================================================
bool WakeTarget::validate(MacAddress& mac, std::string& error) const
{
    if (mac_address.empty())
    {
        error = "No MAC address given";
        return false;
    }

    if (!macAddressText::parse(mac_address, mac, error))
    {
        return false;
    }

    if (!ip_address.empty() && !networkAddresses::isValidIpv4(ip_address))
    {
        error = "IP address " + ip_address + " is not a valid IPv4 address";
        return false;
    }

    return true;
}
