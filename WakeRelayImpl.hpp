#if !defined WAKE_RELAY_IMPL_HPP
#define WAKE_RELAY_IMPL_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "FixedRateProgram.hpp"

#include "RelayServerConfig.hpp"

struct RelayCounters;

// Everything about the relay daemon that doesn't depend on the platform: its settings and how
// they are read from the default file and the command line
class WakeRelayImpl : public FixedRateProgram
{
public:

    WakeRelayImpl(int                             argc,
                  char**                          argv,
                  const std::chrono::nanoseconds& period,
                  const std::chrono::nanoseconds& tolerance);

    virtual ~WakeRelayImpl();

    // Body of the main loop, executed periodically and indefinitely
    virtual void step() = 0;

    // Port the relay is accepting connections on, 0 once it has stopped
    virtual std::uint16_t getPort() const = 0;

    virtual const RelayCounters& getCounters() const = 0;

protected:

    // Picks the default file named by -d, if any, out of the program arguments
    void findDefaultFile();

    // Interprets program arguments and applies corresponding state
    bool processArguments();

    // Reads KEY=VALUE settings; unknown keys are ignored, bad values are not
    bool processDefaultFile(const std::string& filename);

    // Filename of the default settings file, typically located in /etc/wakerelay
    std::string default_filename;

    // Filename of the log file, typically located in /var/log
    std::string log_filename;

    // Filename of the file in which PID is stored
    std::string pid_filename;

    RelayServerConfig config;
};

#endif
