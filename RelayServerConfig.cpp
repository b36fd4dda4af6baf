#include "RelayServerConfig.hpp"

#include "LocalDelivery.hpp"

//=============================================================================================
RelayServerConfig::RelayServerConfig() :
    listen_address("0.0.0.0"),
    port(DEFAULT_PORT),
    broadcast_address(LocalDelivery::GLOBAL_BROADCAST_ADDRESS),
    interface_broadcast(false),
    max_request_size(DEFAULT_MAX_REQUEST_SIZE)
{
}
