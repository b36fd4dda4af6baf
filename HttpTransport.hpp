#if !defined HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "HttpMessage.hpp"

class CancellationToken;

// Time limits for one HTTP exchange
struct HttpTimeouts
{
    HttpTimeouts(const std::chrono::milliseconds& request,
                 const std::chrono::milliseconds& resource);

    // Longest the exchange may go without making progress
    std::chrono::milliseconds request;

    // Longest the whole exchange, connection setup included, may take
    std::chrono::milliseconds resource;
};

// Performs one request/response exchange with an HTTP server
class HttpTransport
{
public:

    enum Outcome
    {
        // A response was received; its status may still be anything
        COMPLETED,

        TIMED_OUT,

        // Name resolution, connection or socket I/O failed
        CONNECTION_FAILED,

        // The server sent something that isn't an HTTP response
        MALFORMED_RESPONSE,

        CANCELLED
    };

    HttpTransport();

    virtual ~HttpTransport();

    // On COMPLETED response holds the server's answer; otherwise error says what went wrong
    virtual Outcome perform(const std::string&       host,
                            std::uint16_t            port,
                            const HttpRequest&       request,
                            const HttpTimeouts&      timeouts,
                            const CancellationToken& cancellation,
                            HttpResponse&            response,
                            std::string&             error) = 0;

    static const char* describeOutcome(Outcome outcome);

private:

    HttpTransport(const HttpTransport&);
    HttpTransport& operator=(const HttpTransport&);
};

#endif
