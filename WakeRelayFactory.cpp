#include <chrono>

#include "WakeRelayFactory.hpp"

#if defined LINUX || defined MACOS
#include "PosixWakeRelayImpl.hpp"
#endif

//=============================================================================================
WakeRelayImpl* WakeRelayFactory::createWakeRelay(int                             argc,
                                                 char**                          argv,
                                                 const std::chrono::nanoseconds& period,
                                                 const std::chrono::nanoseconds& tolerance)
{
#if defined LINUX || defined MACOS
    return new PosixWakeRelayImpl(argc, argv, period, tolerance);
#else
    return 0;
#endif
}
