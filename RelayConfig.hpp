#if !defined RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

#include <cstdint>
#include <string>

// Where and how to reach a relay gateway
struct RelayConfig
{
    static const std::uint16_t DEFAULT_PORT = 5000;

    RelayConfig();

    // Only meaningful when relay mode is enabled; checks host and port
    bool validate(std::string& error) const;

    // Relay mode
    bool enabled;

    // IPv4 address or hostname
    std::string host;

    // Kept wider than a port so out-of-range configuration can be reported
    unsigned int port;

    // Sent as X-API-Key when not empty
    std::string api_key;

    // Deliver locally if the relay can't be used
    bool fallback_local;
};

#endif
