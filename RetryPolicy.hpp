#if !defined RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <random>

// Exponential backoff with additive jitter for relay requests.  The delay after failed attempt
// n (counting from 1) is
//
//     min(2^(n-1) * BASE_DELAY * multiplier, MAX_DELAY) * (1 + jitter)
//
// where multiplier is RATE_LIMIT_MULTIPLIER after a rate-limit response and 1 otherwise, and
// jitter is drawn uniformly from [MIN_JITTER, MAX_JITTER] so that many clients retrying at
// once spread out.
class RetryPolicy
{
public:

    // Returns a jitter fraction in [MIN_JITTER, MAX_JITTER]
    typedef std::function<double()> JitterSource;

    static const unsigned int MAX_ATTEMPTS = 4;

    static const double BASE_DELAY_SECONDS;
    static const double MAX_DELAY_SECONDS;
    static const double RATE_LIMIT_MULTIPLIER;
    static const double MIN_JITTER;
    static const double MAX_JITTER;

    // Jitter comes from a std::mt19937 seeded from std::random_device
    RetryPolicy();

    // Jitter comes from a std::mt19937 with the given seed
    explicit RetryPolicy(std::uint32_t seed);

    explicit RetryPolicy(const JitterSource& jitter_source);

    ~RetryPolicy();

    // Whether another attempt is allowed after failed_attempts attempts have failed
    bool shouldRetry(unsigned int failed_attempts) const;

    // The capped exponential part of the delay after the given failed attempt
    std::chrono::duration<double> getExponentialDelay(unsigned int failed_attempt,
                                                      bool         rate_limited) const;

    // The full delay, jitter included, to wait after the given failed attempt
    std::chrono::duration<double> getDelay(unsigned int failed_attempt, bool rate_limited);

private:

    std::mt19937 generator;

    std::uniform_real_distribution<double> distribution;

    JitterSource jitter_source;
};

#endif
