#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <vector>

#include "NetworkAddresses.hpp"

#include "MacAddress.hpp"

#include "MacAddressText.hpp"

//=============================================================================================
bool networkAddresses::isValidIpv4(const std::string& address)
{
    in_addr converted;
    return inet_pton(AF_INET, address.c_str(), &converted) == 1;
}

//=============================================================================================
bool networkAddresses::isValidHostname(const std::string& hostname)
{
    if (hostname.empty() || hostname.length() > 253)
    {
        return false;
    }

    // An all-numeric final label would make something like 300.1.1.1 a hostname
    const std::string::size_type last_dot = hostname.rfind('.');
    const std::string last_label =
        last_dot == std::string::npos ? hostname : hostname.substr(last_dot + 1);
    if (last_label.find_first_not_of("0123456789") == std::string::npos)
    {
        return false;
    }

    std::string::size_type label_start = 0;
    while (label_start <= hostname.length())
    {
        std::string::size_type label_end = hostname.find('.', label_start);
        if (label_end == std::string::npos)
        {
            label_end = hostname.length();
        }

        const std::string label = hostname.substr(label_start, label_end - label_start);

        // Labels are 1-63 alphanumerics or hyphens, and don't begin or end with a hyphen
        if (label.empty() || label.length() > 63 ||
            label[0] == '-' || label[label.length() - 1] == '-')
        {
            return false;
        }

        for (std::string::const_iterator iter = label.begin(); iter != label.end(); ++iter)
        {
            if (!std::isalnum(static_cast<unsigned char>(*iter)) && *iter != '-')
            {
                return false;
            }
        }

        label_start = label_end + 1;
    }

    return true;
}

//=============================================================================================
bool networkAddresses::isUsableWakeAddress(const MacAddress& mac_address)
{
    const std::string formatted = macAddressText::format(mac_address);

    for (std::string::const_iterator iter = formatted.begin(); iter != formatted.end(); ++iter)
    {
        if (*iter != ':' && *iter != formatted[0])
        {
            return true;
        }
    }

    return false;
}

//=============================================================================================
bool networkAddresses::isUsableTargetIpv4(const std::string& address)
{
    in_addr converted;
    if (inet_pton(AF_INET, address.c_str(), &converted) != 1)
    {
        return false;
    }

    const in_addr_t host_order = ntohl(converted.s_addr);

    return host_order != INADDR_ANY &&
           host_order != INADDR_BROADCAST &&
           (host_order >> 24) != 127;
}

//=============================================================================================
bool networkAddresses::getInterfaceBroadcastAddresses(
    std::vector<std::string>& broadcast_addresses,
    std::string&              error)
{
    ifaddrs* interfaces = 0;
    if (getifaddrs(&interfaces) == -1)
    {
        error = std::string("getifaddrs failed: ") + std::strerror(errno);
        return false;
    }

    for (ifaddrs* iface = interfaces; iface != 0; iface = iface->ifa_next)
    {
        if (!iface->ifa_addr || !iface->ifa_netmask || iface->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }

        if (!(iface->ifa_flags & IFF_UP) ||
            (iface->ifa_flags & IFF_LOOPBACK) ||
            !(iface->ifa_flags & IFF_BROADCAST))
        {
            continue;
        }

        const sockaddr_in* address = reinterpret_cast<const sockaddr_in*>(iface->ifa_addr);
        const sockaddr_in* netmask = reinterpret_cast<const sockaddr_in*>(iface->ifa_netmask);

        // Broadcast is the network address with all host bits set
        in_addr broadcast;
        broadcast.s_addr = (address->sin_addr.s_addr & netmask->sin_addr.s_addr) |
            ~netmask->sin_addr.s_addr;

        char broadcast_cstr[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &broadcast, broadcast_cstr, sizeof(broadcast_cstr)))
        {
            continue;
        }

        const std::string broadcast_str(broadcast_cstr);
        if (std::find(broadcast_addresses.begin(), broadcast_addresses.end(), broadcast_str) ==
            broadcast_addresses.end())
        {
            broadcast_addresses.push_back(broadcast_str);
        }
    }

    freeifaddrs(interfaces);

    return true;
}
