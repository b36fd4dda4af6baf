#include <cstdint>
#include <vector>

#include "MagicPacket.hpp"

#include "MacAddress.hpp"
#include "MacAddressText.hpp"

//=============================================================================================
MagicPacket::MagicPacket(const MacAddress& mac_address) :
    mac_address(mac_address),
    bytes(LENGTH, 0xff)
{
    // The first SYNC_LENGTH bytes stay 0xff; add 16 repetitions of the MAC address after them
    for (unsigned int i = 0; i < REPETITIONS; i++)
    {
        mac_address.DataField::writeRaw(&bytes[SYNC_LENGTH + macAddressText::LENGTH * i]);
    }
}

//=============================================================================================
const std::vector<std::uint8_t>& MagicPacket::getBytes() const
{
    return bytes;
}

//=============================================================================================
const MacAddress& MagicPacket::getMacAddress() const
{
    return mac_address;
}
