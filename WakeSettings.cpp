#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "WakeSettings.hpp"

const char* const WakeSettings::DEFAULT_SETTINGS_FILENAME = "/etc/wakerelay/wakesend.conf";

namespace
{
    // Strips spaces, tabs and a trailing carriage return from both ends
    std::string trim(const std::string& text)
    {
        const char* const whitespace = " \t\r";

        const std::size_t first = text.find_first_not_of(whitespace);
        if (first == std::string::npos)
        {
            return std::string();
        }

        const std::size_t last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }
}

//=============================================================================================
WakeSettings::WakeSettings() :
    interface_broadcast(false),
    settings_filename(DEFAULT_SETTINGS_FILENAME)
{
}

//=============================================================================================
WakeSettings::~WakeSettings()
{
}

//=============================================================================================
bool WakeSettings::load(const std::vector<std::string>& arguments, std::string& error)
{
    // The settings file has to be read before any other switch is applied, so look for -c
    // first
    bool settings_file_required = false;
    for (std::vector<std::string>::const_iterator current_argument = arguments.begin();
         current_argument != arguments.end();
         ++current_argument)
    {
        if (*current_argument == "-c" && current_argument + 1 != arguments.end())
        {
            settings_filename = *(current_argument + 1);
            settings_file_required = true;
        }
    }

    std::ifstream settings_file(settings_filename.c_str());
    const bool settings_file_exists = !settings_file.fail();
    settings_file.close();

    if (settings_file_exists || settings_file_required)
    {
        if (!processSettingsFile(settings_filename, error))
        {
            return false;
        }
    }

    return processArguments(arguments, error);
}

//=============================================================================================
bool WakeSettings::processSettingsFile(const std::string& filename, std::string& error)
{
    std::ifstream settings_stream(filename.c_str());
    if (settings_stream.fail())
    {
        error = "Cannot open settings file " + filename;
        return false;
    }

    std::string raw_line;
    unsigned int line_number = 0;

    while (std::getline(settings_stream, raw_line))
    {
        line_number++;

        const std::string line = trim(raw_line);

        // Skip blanks and comments
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        const std::size_t equal_sign = line.find('=');
        if (equal_sign == std::string::npos || equal_sign == 0)
        {
            continue;
        }

        const std::string key   = trim(line.substr(0, equal_sign));
        const std::string value = trim(line.substr(equal_sign + 1));

        if (key == "DEVICE_NAME")
        {
            target.name = value;
        }
        else if (key == "DEVICE_IP")
        {
            target.ip_address = value;
        }
        else if (key == "DEVICE_MAC")
        {
            target.mac_address = value;
        }
        else if (key == "RELAY_MODE")
        {
            relay.enabled = value == "yes";
        }
        else if (key == "RELAY_HOST")
        {
            relay.host = value;
        }
        else if (key == "RELAY_PORT")
        {
            std::string port_error;
            if (!parsePort(value, relay.port, port_error))
            {
                std::ostringstream message;
                message << filename << ":" << line_number << ": " << port_error;
                error = message.str();
                return false;
            }
        }
        else if (key == "RELAY_API_KEY")
        {
            relay.api_key = value;
        }
        else if (key == "FALLBACK_LOCAL")
        {
            relay.fallback_local = value == "yes";
        }
        else if (key == "INTERFACE_BROADCAST")
        {
            interface_broadcast = value == "yes";
        }
        else if (key == "LOG_FILE")
        {
            log_filename = value;
        }
    }

    return true;
}

//=============================================================================================
bool WakeSettings::processArguments(const std::vector<std::string>& arguments,
                                    std::string&                    error)
{
    std::vector<std::string>::const_iterator current_argument = arguments.begin();

    while (current_argument != arguments.end())
    {
        std::vector<std::string>::const_iterator next_argument = current_argument + 1;

        if (*current_argument == "--relay")
        {
            relay.enabled = true;
        }
        else if (*current_argument == "--local")
        {
            relay.enabled = false;
        }
        else if (*current_argument == "--fallback")
        {
            relay.fallback_local = true;
        }
        else if (*current_argument == "--interfaces")
        {
            interface_broadcast = true;
        }
        else if (next_argument != arguments.end())
        {
            bool twoarg_processed = true;

            if (*current_argument == "-c")
            {
                // Already read by load()
            }
            else if (*current_argument == "-n")
            {
                target.name = *next_argument;
            }
            else if (*current_argument == "-i")
            {
                target.ip_address = *next_argument;
            }
            else if (*current_argument == "-m")
            {
                target.mac_address = *next_argument;
            }
            else if (*current_argument == "-r")
            {
                relay.host = *next_argument;
            }
            else if (*current_argument == "-p")
            {
                if (!parsePort(*next_argument, relay.port, error))
                {
                    return false;
                }
            }
            else if (*current_argument == "-k")
            {
                relay.api_key = *next_argument;
            }
            else if (*current_argument == "-l")
            {
                log_filename = *next_argument;
            }
            else
            {
                twoarg_processed = false;
            }

            if (!twoarg_processed)
            {
                error = "Unrecognized argument " + *current_argument;
                return false;
            }

            ++current_argument;
        }
        else
        {
            error = "Unrecognized argument " + *current_argument;
            return false;
        }

        ++current_argument;
    }

    return true;
}

//=============================================================================================
std::string WakeSettings::getUsage()
{
    return
        "Usage: wakesend [-c settings_file] [-n name] [-i ip] [-m mac]\n"
        "                [--relay | --local] [-r relay_host] [-p relay_port] [-k api_key]\n"
        "                [--fallback] [--interfaces] [-l log_file]\n";
}

//=============================================================================================
bool WakeSettings::parsePort(const std::string& text, unsigned int& port, std::string& error)
{
    std::istringstream convert_to_number(text);
    unsigned int value = 0;

    if (text.empty() || text[0] == '-' || !(convert_to_number >> value) ||
        !convert_to_number.eof())
    {
        error = "Invalid relay port \"" + text + "\"";
        return false;
    }

    port = value;
    return true;
}
