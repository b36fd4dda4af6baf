#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "MagicPacket_test.hpp"

#include "MacAddress.hpp"
#include "MacAddressText.hpp"
#include "MagicPacket.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(MagicPacket_test);

namespace
{
    // Six bytes of 0xff, then the address 16 times
    bool hasWakeLayout(const MagicPacket& magic_packet, const unsigned char* raw)
    {
        const std::vector<std::uint8_t>& bytes = magic_packet.getBytes();

        if (bytes.size() != 102)
        {
            std::cout << "Magic packet is " << bytes.size() << " bytes\n";
            return false;
        }

        for (unsigned int i = 0; i < MagicPacket::SYNC_LENGTH; i++)
        {
            if (bytes[i] != 0xff)
            {
                std::cout << "Sync byte " << i << " is not 0xff\n";
                return false;
            }
        }

        for (unsigned int k = 0; k < MagicPacket::REPETITIONS; k++)
        {
            for (unsigned int j = 0; j < macAddressText::LENGTH; j++)
            {
                if (bytes[MagicPacket::SYNC_LENGTH + k * macAddressText::LENGTH + j] != raw[j])
                {
                    std::cout << "Repetition " << k << " differs at byte " << j << "\n";
                    return false;
                }
            }
        }

        return true;
    }
}

//==============================================================================
void MagicPacket_test::addTestCases()
{
    ADD_TEST_CASE(Layout);
    ADD_TEST_CASE(Deterministic);
    ADD_TEST_CASE(LayoutSweep);
}

//==============================================================================
Test::Result MagicPacket_test::Layout::body()
{
    if (MagicPacket::LENGTH != 102)
    {
        return Test::FAILED;
    }

    unsigned char raw[macAddressText::LENGTH] = {0x00, 0x1b, 0x63, 0x84, 0x45, 0xe6};
    MagicPacket magic_packet((MacAddress(raw)));

    if (!hasWakeLayout(magic_packet, raw))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result MagicPacket_test::Deterministic::body()
{
    MacAddress mac;
    std::string error;
    if (!macAddressText::parse("00:1B:63:84:45:E6", mac, error))
    {
        return Test::FAILED;
    }

    MagicPacket first(mac);
    MagicPacket second(mac);

    if (first.getBytes() != second.getBytes() || !(second.getMacAddress() == mac))
    {
        return Test::FAILED;
    }

    return Test::PASSED;
}

//==============================================================================
// The extremes plus a fixed-seed sample of other addresses
//==============================================================================
Test::Result MagicPacket_test::LayoutSweep::body()
{
    std::vector<std::vector<unsigned char> > addresses;
    addresses.push_back(std::vector<unsigned char>(macAddressText::LENGTH, 0x00));
    addresses.push_back(std::vector<unsigned char>(macAddressText::LENGTH, 0xff));

    std::mt19937 generator(102);
    std::uniform_int_distribution<unsigned int> byte_value(0, 255);
    for (unsigned int i = 0; i < 500; i++)
    {
        std::vector<unsigned char> raw(macAddressText::LENGTH);
        for (unsigned int j = 0; j < macAddressText::LENGTH; j++)
        {
            raw[j] = static_cast<unsigned char>(byte_value(generator));
        }

        addresses.push_back(raw);
    }

    for (std::vector<std::vector<unsigned char> >::iterator i = addresses.begin();
         i != addresses.end();
         ++i)
    {
        MagicPacket magic_packet((MacAddress(&(*i)[0])));

        if (!hasWakeLayout(magic_packet, &(*i)[0]))
        {
            return Test::FAILED;
        }
    }

    return Test::PASSED;
}
