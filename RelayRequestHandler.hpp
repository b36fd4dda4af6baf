#if !defined RELAY_REQUEST_HANDLER_HPP
#define RELAY_REQUEST_HANDLER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "MacAddress.hpp"

#include "HttpMessage.hpp"
#include "RelayServerConfig.hpp"

class LocalDelivery;
class Log;

// Running totals kept by the relay gateway.  Updated from the connection thread and from the
// thread delivering magic packets.
struct RelayCounters
{
    RelayCounters();

    std::atomic<std::uint64_t> requests_total;
    std::atomic<std::uint64_t> wakes_sent;
    std::atomic<std::uint64_t> validation_errors;
    std::atomic<std::uint64_t> authentication_failures;
    std::atomic<std::uint64_t> delivery_failures;
};

// A validated wake request whose magic packets haven't been sent yet
struct WakeOrder
{
    WakeOrder();

    MacAddress mac_address;

    // Empty when the request named no target
    std::string target_ip;

    std::string name;
};

// Turns relay gateway requests into responses.  Knows nothing about sockets; connections hand
// it decoded requests and write back whatever it returns.  Answering a wake takes a second
// step, deliver(), which blocks for as long as the magic packets take to send and so is run
// away from the connection thread.
//
//     GET  /health   liveness, no authentication
//     POST /wol      validate and deliver a magic packet
//     GET  /status   counters and configuration summary
//
// /wol and /status require the X-API-Key header to match the configured key, if one is set.
class RelayRequestHandler
{
public:

    static const char* const SERVER_NAME;
    static const char* const VERSION;

    // Longest device name accepted in a wake request
    static const std::size_t MAX_NAME_LENGTH = 100;

    RelayRequestHandler(LocalDelivery&           local_delivery,
                        Log&                     log,
                        const RelayServerConfig& config);

    ~RelayRequestHandler();

    // Returns true with the answer in response, or false with a validated wake in order that
    // has to go through deliver() for its answer
    bool handle(const HttpRequest& request,
                const std::string& remote_address,
                HttpResponse&      response,
                WakeOrder&         order);

    // Sends the magic packets for a wake that handle() accepted
    HttpResponse deliver(const WakeOrder& order);

    // For requests whose declared body is over the size limit; request holds only the head
    HttpResponse handleOversized(const HttpRequest& request,
                                 const std::string& remote_address);

    // For bytes that couldn't be decoded as an HTTP request
    HttpResponse handleMalformed(const std::string& remote_address, const std::string& error);

    const RelayCounters& getCounters() const;

    const RelayServerConfig& getConfig() const;

private:

    enum Endpoint
    {
        ENDPOINT_HEALTH,
        ENDPOINT_WOL,
        ENDPOINT_STATUS
    };

    // Resolves the endpoint and checks method and credentials.  Returns false with the
    // rejection in response if the request can't go any further.
    bool admit(const HttpRequest& request,
               const std::string& remote_address,
               Endpoint&          endpoint,
               HttpResponse&      response);

    bool isAuthorized(const HttpRequest& request) const;

    HttpResponse handleHealth();

    // Returns false with the rejection in response, or true with the wake to send in order
    bool validateWake(const HttpRequest& request,
                      const std::string& remote_address,
                      HttpResponse&      response,
                      WakeOrder&         order);

    HttpResponse handleStatus();

    HttpResponse rejectRequest(const std::string& remote_address, const std::string& message);

    static HttpResponse makeResponse(int status_code, const Json::Value& body);

    static HttpResponse makeError(int status_code, const std::string& message);

    static bool isJsonContentType(const boost::beast::string_view& content_type);

    LocalDelivery& local_delivery;

    Log& log;

    RelayServerConfig config;

    RelayCounters counters;

    std::chrono::steady_clock::time_point start_time;

    RelayRequestHandler(const RelayRequestHandler&);
    RelayRequestHandler& operator=(const RelayRequestHandler&);
};

#endif
