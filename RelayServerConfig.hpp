#if !defined RELAY_SERVER_CONFIG_HPP
#define RELAY_SERVER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Settings of the relay gateway daemon
struct RelayServerConfig
{
    static const std::uint16_t DEFAULT_PORT = 5000;

    static const std::size_t DEFAULT_MAX_REQUEST_SIZE = 1024;

    RelayServerConfig();

    // Address the HTTP listener binds to
    std::string listen_address;

    unsigned int port;

    // Empty disables authentication
    std::string api_key;

    // Where magic packets are broadcast
    std::string broadcast_address;

    // Also broadcast on every local interface's subnet
    bool interface_broadcast;

    // Largest request body accepted, in bytes
    std::size_t max_request_size;
};

#endif
