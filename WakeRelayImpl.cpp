#include <chrono>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "WakeRelayImpl.hpp"

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

    bool parseUnsigned(const std::string& text, unsigned long& value)
    {
        if (text.empty() || text[0] == '-')
        {
            return false;
        }

        std::istringstream convert_to_number(text);
        return (convert_to_number >> value) && convert_to_number.eof();
    }

    // Port 0 binds an ephemeral port
    bool parsePort(const std::string& text, unsigned int& port)
    {
        unsigned long value = 0;
        if (!parseUnsigned(text, value) || value > 65535)
        {
            return false;
        }

        port = static_cast<unsigned int>(value);
        return true;
    }
}

//=============================================================================================
WakeRelayImpl::WakeRelayImpl(int                             argc,
                             char**                          argv,
                             const std::chrono::nanoseconds& period,
                             const std::chrono::nanoseconds& tolerance) :
    FixedRateProgram(argc, argv, period, tolerance),
    default_filename("/etc/wakerelay/config"),
    log_filename("/var/log/wakerelayd.log"),
    pid_filename("/var/run/wakerelayd.pid")
{
}

//=============================================================================================
WakeRelayImpl::~WakeRelayImpl()
{
}

//=============================================================================================
// Picks the default file named by -d, if any, out of the program arguments
//=============================================================================================
void WakeRelayImpl::findDefaultFile()
{
    std::vector<std::string> arguments;
    getArguments(arguments);

    for (std::vector<std::string>::const_iterator current_argument = arguments.begin();
         current_argument != arguments.end();
         ++current_argument)
    {
        if (*current_argument == "-d" && current_argument + 1 != arguments.end())
        {
            default_filename = *(current_argument + 1);
        }
    }
}

//=============================================================================================
// Interprets program arguments and applies corresponding state
//=============================================================================================
bool WakeRelayImpl::processArguments()
{
    std::vector<std::string> arguments;
    getArguments(arguments);

    std::vector<std::string>::const_iterator current_argument = arguments.begin();

    while(current_argument != arguments.end())
    {
        std::vector<std::string>::const_iterator next_argument = current_argument + 1;

        // Every switch takes a value
        if (next_argument != arguments.end())
        {
            bool switch_processed = true;

            // -d names the default file, which has already been read
            if (*current_argument == "-d")
            {
            }
            else if (*current_argument == "-p")
            {
                if (!parsePort(*next_argument, config.port))
                {
                    return false;
                }
            }
            else if (*current_argument == "-l")
            {
                log_filename = *next_argument;
            }
            else if (*current_argument == "--pidfile")
            {
                pid_filename = *next_argument;
            }
            else
            {
                switch_processed = false;
            }

            // Skip over the value so it isn't taken for a switch
            if (switch_processed)
            {
                ++current_argument;
            }
        }

        ++current_argument;
    }

    return true;
}

//=============================================================================================
// Parses the wakerelayd default file
//=============================================================================================
bool WakeRelayImpl::processDefaultFile(const std::string& filename)
{
    std::ifstream default_stream(filename.c_str());
    if (default_stream.fail())
    {
        return false;
    }

    std::string default_line;
    while (std::getline(default_stream, default_line))
    {
        default_line = trim(default_line);

        // Ignore the line if it's blank or a comment
        if (default_line.empty() || default_line[0] == '#')
        {
            continue;
        }

        // Lines without a key are skipped
        const std::size_t equal_sign = default_line.find('=');
        if (equal_sign == std::string::npos || equal_sign == 0)
        {
            continue;
        }

        const std::string key   = trim(default_line.substr(0, equal_sign));
        const std::string value = trim(default_line.substr(equal_sign + 1));

        if (key == "LISTEN_ADDRESS")
        {
            config.listen_address = value;
        }
        else if (key == "PORT")
        {
            if (!parsePort(value, config.port))
            {
                return false;
            }
        }
        else if (key == "API_KEY")
        {
            config.api_key = value;
        }
        else if (key == "BROADCAST_ADDRESS")
        {
            config.broadcast_address = value;
        }
        else if (key == "INTERFACE_BROADCAST")
        {
            config.interface_broadcast = value == "yes";
        }
        else if (key == "MAX_REQUEST_SIZE")
        {
            unsigned long max_request_size = 0;
            if (!parseUnsigned(value, max_request_size) || max_request_size == 0)
            {
                return false;
            }

            config.max_request_size = max_request_size;
        }
        else if (key == "LOG_FILE")
        {
            log_filename = value;
        }
        else if (key == "PID_FILE")
        {
            pid_filename = value;
        }
    }

    return true;
}
