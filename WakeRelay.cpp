#include <chrono>
#include <cstdint>
#include <stdexcept>

#include "WakeRelay.hpp"

#include "WakeRelayFactory.hpp"
#include "WakeRelayImpl.hpp"
#include "misc.hpp"

//=============================================================================================
WakeRelay::WakeRelay(int                             argc,
                     char**                          argv,
                     const std::chrono::nanoseconds& period,
                     const std::chrono::nanoseconds& tolerance) :
    wake_relay_impl(0)
{
    wake_relay_impl = WakeRelayFactory::createWakeRelay(argc, argv, period, tolerance);

    if (!wake_relay_impl)
    {
        throw std::runtime_error("No WakeRelayImpl available for this platform");
    }
}

//=============================================================================================
WakeRelay::~WakeRelay()
{
    delete wake_relay_impl;
}

//=============================================================================================
int WakeRelay::run()
{
    IF_NULL_THROW_ELSE_RUN(wake_relay_impl,
                           "No WakeRelayImpl available for this platform",
                           return wake_relay_impl->run());
}

//=============================================================================================
void WakeRelay::step()
{
    IF_NULL_THROW_ELSE_RUN(wake_relay_impl,
                           "No WakeRelayImpl available for this platform",
                           wake_relay_impl->step());
}

//=============================================================================================
bool WakeRelay::getTerminate() const
{
    IF_NULL_THROW_ELSE_RUN(wake_relay_impl,
                           "No WakeRelayImpl available for this platform",
                           return wake_relay_impl->getTerminate());
}

//=============================================================================================
std::uint16_t WakeRelay::getPort() const
{
    IF_NULL_THROW_ELSE_RUN(wake_relay_impl,
                           "No WakeRelayImpl available for this platform",
                           return wake_relay_impl->getPort());
}

//=============================================================================================
const RelayCounters& WakeRelay::getCounters() const
{
    IF_NULL_THROW_ELSE_RUN(wake_relay_impl,
                           "No WakeRelayImpl available for this platform",
                           return wake_relay_impl->getCounters());
}
