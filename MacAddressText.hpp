#if !defined MAC_ADDRESS_TEXT_HPP
#define MAC_ADDRESS_TEXT_HPP

#include <string>

#include "MacAddress.hpp"

// Strict conversion between toolbox MacAddress values and the text users and relays exchange
namespace macAddressText
{
    // Bytes in a MAC address
    const unsigned int LENGTH = 6;

    // Parses colon-separated, hyphen-separated or unseparated hexadecimal notation, in any
    // case.  Separators may not be mixed and exactly 12 hex digits must be present.  Returns
    // false and describes the problem in error if input isn't a MAC address; mac is left
    // untouched in that case.
    bool parse(const std::string& input, MacAddress& mac, std::string& error);

    // Canonical form, uppercase and colon-separated (AA:BB:CC:DD:EE:FF)
    std::string format(const MacAddress& mac);
}

#endif
