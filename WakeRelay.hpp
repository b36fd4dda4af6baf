#if !defined WAKE_RELAY_HPP
#define WAKE_RELAY_HPP

#include <chrono>
#include <cstdint>

class WakeRelayImpl;
struct RelayCounters;

// Platform-independent handle on the relay gateway daemon
class WakeRelay
{
public:

    WakeRelay(int                             argc,
              char**                          argv,
              const std::chrono::nanoseconds& period,
              const std::chrono::nanoseconds& tolerance =
              std::chrono::nanoseconds(static_cast<unsigned int>(1e8)));

    ~WakeRelay();

    // Steps until terminated
    int run();

    // One frame of the main loop
    void step();

    bool getTerminate() const;

    // Port the HTTP listener is bound to; useful when the configured port was 0
    std::uint16_t getPort() const;

    // Request totals since start-up
    const RelayCounters& getCounters() const;

private:

    WakeRelayImpl* wake_relay_impl;

    WakeRelay(const WakeRelay&);
    WakeRelay& operator=(const WakeRelay&);
};

#endif
