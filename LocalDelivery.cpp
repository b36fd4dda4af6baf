#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "LocalDelivery.hpp"

#include "MacAddress.hpp"
#include "MacAddressText.hpp"
#include "Log.hpp"
#include "MagicPacket.hpp"
#include "UdpDispatcher.hpp"

const char* const LocalDelivery::GLOBAL_BROADCAST_ADDRESS = "255.255.255.255";

//=============================================================================================
DeliveryReport::DeliveryReport() :
    success_count(0),
    total_attempts(0)
{
}

//=============================================================================================
bool DeliveryReport::succeeded() const
{
    return success_count > 0;
}

//=============================================================================================
LocalDelivery::LocalDelivery(UdpDispatcher&     dispatcher,
                             Log&               log,
                             const std::string& broadcast_address) :
    dispatcher(dispatcher),
    log(log),
    broadcast_address(broadcast_address)
{
}

//=============================================================================================
LocalDelivery::~LocalDelivery()
{
}

//=============================================================================================
void LocalDelivery::addBroadcastAddress(const std::string& broadcast_address)
{
    extra_broadcast_addresses.push_back(broadcast_address);
}

//=============================================================================================
DeliveryReport LocalDelivery::dispatch(const MacAddress&  mac_address,
                                       const std::string& target_ip)
{
    MagicPacket magic_packet(mac_address);

    const std::string mac_text = macAddressText::format(mac_address);

    std::ostringstream start_message;
    start_message << "Issuing WOL for " << mac_text << " ("
                  << magic_packet.getBytes().size() << " byte magic packet)";
    log.write(start_message.str());

    // Destinations in the order they're tried
    std::vector<std::string> addresses;
    addresses.push_back(broadcast_address);
    if (!target_ip.empty())
    {
        addresses.push_back(target_ip);
    }
    addresses.insert(addresses.end(),
                     extra_broadcast_addresses.begin(),
                     extra_broadcast_addresses.end());

    const std::uint16_t ports[] = {WOL_PORT, LEGACY_WOL_PORT};

    DeliveryReport report;
    for (std::vector<std::string>::const_iterator address = addresses.begin();
         address != addresses.end();
         ++address)
    {
        for (unsigned int i = 0; i < sizeof(ports) / sizeof(ports[0]); i++)
        {
            report.total_attempts++;

            if (dispatcher.send(magic_packet.getBytes(), *address, ports[i]))
            {
                std::ostringstream sent_message;
                sent_message << "Sent magic packet for " << mac_text << " to "
                             << *address << ":" << ports[i];
                log.write(sent_message.str());

                report.success_count++;
            }
        }
    }

    std::ostringstream summary;
    summary << report.success_count << " of " << report.total_attempts
            << " magic packets sent for " << mac_text;
    log.write(report.succeeded() ? summary.str() : "ERROR - " + summary.str());

    return report;
}

//=============================================================================================
const std::string& LocalDelivery::getBroadcastAddress() const
{
    return broadcast_address;
}
