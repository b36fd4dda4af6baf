#if !defined MAGIC_PACKET_HPP
#define MAGIC_PACKET_HPP

#include <cstdint>
#include <vector>

#include "MacAddress.hpp"

#include "MacAddressText.hpp"

// Wake-on-LAN payload: 6 bytes of 0xff followed by 16 repetitions of the target's MAC address
class MagicPacket
{
public:

    static const unsigned int SYNC_LENGTH = 6;
    static const unsigned int REPETITIONS = 16;
    static const unsigned int LENGTH = SYNC_LENGTH + REPETITIONS * macAddressText::LENGTH;

    explicit MagicPacket(const MacAddress& mac_address);

    const std::vector<std::uint8_t>& getBytes() const;

    const MacAddress& getMacAddress() const;

private:

    MacAddress mac_address;

    std::vector<std::uint8_t> bytes;
};

#endif
