#include <sstream>
#include <string>

#include "RelayConfig.hpp"

#include "NetworkAddresses.hpp"

//=============================================================================================
RelayConfig::RelayConfig() :
    enabled(false),
    port(DEFAULT_PORT),
    fallback_local(false)
{
}

//=============================================================================================
bool RelayConfig::validate(std::string& error) const
{
    if (host.empty())
    {
        error = "No relay host given";
        return false;
    }

    if (!networkAddresses::isValidIpv4(host) && !networkAddresses::isValidHostname(host))
    {
        error = "Relay host " + host + " is neither an IPv4 address nor a hostname";
        return false;
    }

    if (port < 1 || port > 65535)
    {
        std::ostringstream message;
        message << "Relay port " << port << " is outside 1-65535";
        error = message.str();
        return false;
    }

    return true;
}
