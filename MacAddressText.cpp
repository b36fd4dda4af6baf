#include <cctype>
#include <string>

#include "MacAddressText.hpp"

#include "MacAddress.hpp"

namespace
{
    // Converts a single hexadecimal digit to its value; assumes c is a valid hex digit
    unsigned char hexValue(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return static_cast<unsigned char>(c - '0');
        }

        const int upper = std::toupper(static_cast<unsigned char>(c));
        return static_cast<unsigned char>(10 + (upper - 'A'));
    }
}

//=============================================================================================
// Strips separators, checks what's left is 12 hex digits and converts pairs of digits into
// bytes, most significant nibble first
//=============================================================================================
bool macAddressText::parse(const std::string& input, MacAddress& mac, std::string& error)
{
    // Ignore surrounding whitespace
    const std::string::size_type first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        error = "MAC address is empty";
        return false;
    }
    const std::string::size_type last = input.find_last_not_of(" \t\r\n");
    const std::string trimmed = input.substr(first, last - first + 1);

    bool has_colon  = false;
    bool has_hyphen = false;
    std::string digits;

    for (std::string::const_iterator iter = trimmed.begin(); iter != trimmed.end(); ++iter)
    {
        if (*iter == ':')
        {
            has_colon = true;
        }
        else if (*iter == '-')
        {
            has_hyphen = true;
        }
        else if (std::isxdigit(static_cast<unsigned char>(*iter)))
        {
            digits += *iter;
        }
        else
        {
            error = "MAC address " + input + " contains a non-hexadecimal character";
            return false;
        }
    }

    if (has_colon && has_hyphen)
    {
        error = "MAC address " + input + " mixes ':' and '-' separators";
        return false;
    }

    if (digits.length() != 2 * LENGTH)
    {
        error = "MAC address " + input + " does not contain exactly 12 hexadecimal digits";
        return false;
    }

    unsigned char raw[LENGTH];
    for (unsigned int i = 0; i < LENGTH; i++)
    {
        raw[i] = static_cast<unsigned char>((hexValue(digits[2 * i]) << 4) |
                                            hexValue(digits[2 * i + 1]));
    }

    mac = MacAddress(raw);

    return true;
}

//=============================================================================================
std::string macAddressText::format(const MacAddress& mac)
{
    static const char HEX_DIGITS[] = "0123456789ABCDEF";

    unsigned char raw[LENGTH];
    mac.DataField::writeRaw(raw);

    std::string formatted;
    formatted.reserve(3 * LENGTH - 1);

    for (unsigned int i = 0; i < LENGTH; i++)
    {
        if (i != 0)
        {
            formatted += ':';
        }

        formatted += HEX_DIGITS[raw[i] >> 4];
        formatted += HEX_DIGITS[raw[i] & 0x0f];
    }

    return formatted;
}
