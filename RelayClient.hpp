#if !defined RELAY_CLIENT_HPP
#define RELAY_CLIENT_HPP

#include <chrono>
#include <string>

#include "HttpTransport.hpp"

class CancellationToken;
class Log;
class RetryPolicy;
struct RelayConfig;
struct WakeTarget;

// Asks a relay gateway to wake a device on the relay's own network.  The relay's health is
// checked first; the wake request is then retried with backoff on rate limiting, server errors
// and network trouble.
class RelayClient
{
public:

    static const char* const HEALTH_PATH;
    static const char* const WAKE_PATH;
    static const char* const API_KEY_HEADER;
    static const char* const USER_AGENT;

    static const HttpTimeouts HEALTH_CHECK_TIMEOUTS;
    static const HttpTimeouts WAKE_REQUEST_TIMEOUTS;

    // How a wake request response status is handled
    enum StatusAction
    {
        // 200, 202 and 204
        ACCEPT,

        // 401 and 403; terminal
        AUTHENTICATION_FAILURE,

        // 429; retried with a longer backoff
        RATE_LIMITED,

        // Any other 4xx; terminal
        CLIENT_ERROR,

        // 5xx; retried
        SERVER_ERROR,

        // Anything else; retried like a network error
        UNEXPECTED_STATUS
    };

    struct Outcome
    {
        Outcome();

        bool success;

        // The operation was abandoned because of cancellation
        bool cancelled;

        bool health_check_passed;

        // Number of wake requests issued
        unsigned int wake_requests;

        // Status of the last HTTP response received, zero if none
        int http_status;

        std::string message;
    };

    static StatusAction classifyStatus(int status_code);

    static bool isRetryable(StatusAction action);

    RelayClient(HttpTransport& transport, RetryPolicy& retry_policy, Log& log);

    virtual ~RelayClient();

    // Runs the health check and then the wake request with retries.  Never throws for
    // network or protocol failures; they are reported through the outcome.
    Outcome dispatch(const WakeTarget&        target,
                     const RelayConfig&       relay,
                     const CancellationToken& cancellation);

    // GET /health; passes on HTTP 200 with a JSON body whose status is "ok" (or "healthy")
    bool checkHealth(const RelayConfig&       relay,
                     const CancellationToken& cancellation,
                     int&                     http_status,
                     std::string&             message);

protected:

    // Waits out a backoff delay.  Returns false if cancelled first.
    virtual bool pause(const std::chrono::duration<double>& delay,
                       const CancellationToken&             cancellation);

private:

    HttpRequest buildWakeRequest(const WakeTarget& target, const RelayConfig& relay) const;

    HttpTransport& transport;

    RetryPolicy& retry_policy;

    Log& log;

    RelayClient(const RelayClient&);
    RelayClient& operator=(const RelayClient&);
};

#endif
