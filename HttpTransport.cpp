#include <chrono>

#include "HttpTransport.hpp"

//=============================================================================================
HttpTimeouts::HttpTimeouts(const std::chrono::milliseconds& request,
                           const std::chrono::milliseconds& resource) :
    request(request),
    resource(resource)
{
}

//=============================================================================================
HttpTransport::HttpTransport()
{
}

//=============================================================================================
HttpTransport::~HttpTransport()
{
}

//=============================================================================================
const char* HttpTransport::describeOutcome(Outcome outcome)
{
    switch (outcome)
    {
    case COMPLETED:          return "completed";
    case TIMED_OUT:          return "timed out";
    case CONNECTION_FAILED:  return "connection failed";
    case MALFORMED_RESPONSE: return "malformed response";
    case CANCELLED:          return "cancelled";
    }

    return "unknown";
}
