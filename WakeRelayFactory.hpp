#if !defined WAKE_RELAY_FACTORY_HPP
#define WAKE_RELAY_FACTORY_HPP

#include <chrono>

class WakeRelayImpl;

// Provides a platform-independent way of acquiring the platform-specific relay daemon
class WakeRelayFactory
{
public:

    // Returns 0 where no implementation exists for this platform
    static WakeRelayImpl* createWakeRelay(int                             argc,
                                          char**                          argv,
                                          const std::chrono::nanoseconds& period,
                                          const std::chrono::nanoseconds& tolerance);

private:

    // Disallowed, only static functions here
    WakeRelayFactory();
    ~WakeRelayFactory();

    WakeRelayFactory(const WakeRelayFactory&);
    WakeRelayFactory& operator=(const WakeRelayFactory&);
};

#endif
