#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

#include "RetryPolicy.hpp"

const double RetryPolicy::BASE_DELAY_SECONDS    = 0.8;
const double RetryPolicy::MAX_DELAY_SECONDS     = 15.0;
const double RetryPolicy::RATE_LIMIT_MULTIPLIER = 3.0;
const double RetryPolicy::MIN_JITTER            = 0.1;
const double RetryPolicy::MAX_JITTER            = 0.4;

//=============================================================================================
RetryPolicy::RetryPolicy() :
    generator(std::random_device()()),
    distribution(MIN_JITTER, MAX_JITTER)
{
}

//=============================================================================================
RetryPolicy::RetryPolicy(std::uint32_t seed) :
    generator(seed),
    distribution(MIN_JITTER, MAX_JITTER)
{
}

//=============================================================================================
RetryPolicy::RetryPolicy(const JitterSource& jitter_source) :
    distribution(MIN_JITTER, MAX_JITTER),
    jitter_source(jitter_source)
{
}

//=============================================================================================
RetryPolicy::~RetryPolicy()
{
}

//=============================================================================================
bool RetryPolicy::shouldRetry(unsigned int failed_attempts) const
{
    return failed_attempts < MAX_ATTEMPTS;
}

//=============================================================================================
std::chrono::duration<double> RetryPolicy::getExponentialDelay(unsigned int failed_attempt,
                                                               bool         rate_limited) const
{
    const double multiplier = rate_limited ? RATE_LIMIT_MULTIPLIER : 1.0;
    const double exponent   = failed_attempt > 0 ? failed_attempt - 1.0 : 0.0;

    return std::chrono::duration<double>(
        std::min(std::pow(2.0, exponent) * BASE_DELAY_SECONDS * multiplier,
                 MAX_DELAY_SECONDS));
}

//=============================================================================================
std::chrono::duration<double> RetryPolicy::getDelay(unsigned int failed_attempt,
                                                    bool         rate_limited)
{
    const std::chrono::duration<double> exponential_delay =
        getExponentialDelay(failed_attempt, rate_limited);

    double jitter = jitter_source ? jitter_source() : distribution(generator);

    // Injected sources are clamped to the jitter band
    jitter = std::max(MIN_JITTER, std::min(jitter, MAX_JITTER));

    return exponential_delay + exponential_delay * jitter;
}
