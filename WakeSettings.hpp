#if !defined WAKE_SETTINGS_HPP
#define WAKE_SETTINGS_HPP

#include <string>
#include <vector>

#include "RelayConfig.hpp"
#include "WakeTarget.hpp"

// Configuration of one wakesend run, read from a KEY=VALUE settings file and then overridden
// by command line switches
class WakeSettings
{
public:

    static const char* const DEFAULT_SETTINGS_FILENAME;

    WakeSettings();

    ~WakeSettings();

    // Reads the settings file named by -c (or the default file, if it exists) and then applies
    // the remaining switches.  arguments excludes the program name.
    bool load(const std::vector<std::string>& arguments, std::string& error);

    // Applies KEY=VALUE lines from the named file; unknown keys are ignored
    bool processSettingsFile(const std::string& filename, std::string& error);

    bool processArguments(const std::vector<std::string>& arguments, std::string& error);

    static std::string getUsage();

    WakeTarget target;

    RelayConfig relay;

    // Also send to the broadcast address of every local interface
    bool interface_broadcast;

    // Empty means log to standard output
    std::string log_filename;

    std::string settings_filename;

private:

    static bool parsePort(const std::string& text, unsigned int& port, std::string& error);
};

#endif
