#if !defined ASIO_HTTP_TRANSPORT_HPP
#define ASIO_HTTP_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "HttpTransport.hpp"

// Plain-HTTP transport built on Boost.Asio, with Boost.Beast doing the HTTP framing.  Each
// exchange runs on a private io_context that is driven in short slices so timeouts and
// cancellation are noticed promptly; when either fires the connection is closed and every
// pending handler is discarded with the io_context.
class AsioHttpTransport : public HttpTransport
{
public:

    AsioHttpTransport();

    virtual ~AsioHttpTransport();

    virtual Outcome perform(const std::string&       host,
                            std::uint16_t            port,
                            const HttpRequest&       request,
                            const HttpTimeouts&      timeouts,
                            const CancellationToken& cancellation,
                            HttpResponse&            response,
                            std::string&             error);

private:

    // Longest the io_context runs before timeouts and cancellation are rechecked
    static const std::chrono::milliseconds POLL_PERIOD;

    // Responses bigger than this are abandoned
    static const std::size_t MAX_RESPONSE_SIZE;
};

#endif
