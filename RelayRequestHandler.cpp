#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include <boost/beast/http.hpp>
#include <json/json.h>

#include "RelayRequestHandler.hpp"

#include "MacAddress.hpp"

#include "HttpMessage.hpp"
#include "JsonBody.hpp"
#include "LocalDelivery.hpp"
#include "Log.hpp"
#include "MacAddressText.hpp"
#include "MagicPacket.hpp"
#include "NetworkAddresses.hpp"

const char* const RelayRequestHandler::SERVER_NAME = "wakerelayd";
const char* const RelayRequestHandler::VERSION     = "1.0";

namespace
{
    namespace http = boost::beast::http;

    const char* const API_KEY_HEADER = "X-API-Key";

    // Takes time that depends only on the lengths involved, never on where the first
    // difference is
    bool constantTimeEquals(const std::string& left, const std::string& right)
    {
        const std::size_t length =
            left.length() > right.length() ? left.length() : right.length();

        unsigned char difference = left.length() == right.length() ? 0 : 1;
        for (std::size_t i = 0; i < length; i++)
        {
            const unsigned char l = i < left.length()  ? left[i]  : 0;
            const unsigned char r = i < right.length() ? right[i] : 0;
            difference |= l ^ r;
        }

        return difference == 0;
    }

    std::string toString(const boost::beast::string_view& text)
    {
        return std::string(text.data(), text.size());
    }

    // Drops the query string
    std::string getPath(const boost::beast::string_view& target)
    {
        const std::string path = toString(target);
        return path.substr(0, path.find('?'));
    }
}

//=============================================================================================
RelayCounters::RelayCounters() :
    requests_total(0),
    wakes_sent(0),
    validation_errors(0),
    authentication_failures(0),
    delivery_failures(0)
{
}

//=============================================================================================
WakeOrder::WakeOrder()
{
}

//=============================================================================================
RelayRequestHandler::RelayRequestHandler(LocalDelivery&           local_delivery,
                                         Log&                     log,
                                         const RelayServerConfig& config) :
    local_delivery(local_delivery),
    log(log),
    config(config),
    start_time(std::chrono::steady_clock::now())
{
}

//=============================================================================================
RelayRequestHandler::~RelayRequestHandler()
{
}

//=============================================================================================
bool RelayRequestHandler::handle(const HttpRequest& request,
                                 const std::string& remote_address,
                                 HttpResponse&      response,
                                 WakeOrder&         order)
{
    Endpoint endpoint;
    if (!admit(request, remote_address, endpoint, response))
    {
        return true;
    }

    switch (endpoint)
    {
    case ENDPOINT_HEALTH:
        response = handleHealth();
        return true;
    case ENDPOINT_WOL:
        return !validateWake(request, remote_address, response, order);
    case ENDPOINT_STATUS:
        response = handleStatus();
        return true;
    }

    response = makeError(500, "Internal server error");
    return true;
}

//=============================================================================================
HttpResponse RelayRequestHandler::deliver(const WakeOrder& order)
{
    DeliveryReport report = local_delivery.dispatch(order.mac_address, order.target_ip);

    if (!report.succeeded())
    {
        counters.delivery_failures++;
        return makeError(500, "Failed to send magic packet");
    }

    counters.wakes_sent++;

    Json::Value body(Json::objectValue);
    body["status"]       = "sent";
    body["mac"]          = macAddressText::format(order.mac_address);
    body["broadcast_ip"] = local_delivery.getBroadcastAddress();
    body["packet_size"]  = MagicPacket::LENGTH;
    body["packets_sent"] = report.success_count;
    body["name"]         = order.name;
    if (!order.target_ip.empty())
    {
        body["target_ip"] = order.target_ip;
    }

    return makeResponse(200, body);
}

//=============================================================================================
HttpResponse RelayRequestHandler::handleOversized(const HttpRequest& request,
                                                  const std::string& remote_address)
{
    Endpoint endpoint;
    HttpResponse response;
    if (!admit(request, remote_address, endpoint, response))
    {
        return response;
    }

    if (endpoint == ENDPOINT_WOL && !isJsonContentType(request[http::field::content_type]))
    {
        return rejectRequest(remote_address, "Content-Type must be application/json");
    }

    counters.validation_errors++;

    std::ostringstream message;
    message << "Request body exceeds " << config.max_request_size << " bytes";
    log.write("ERROR - Rejected request from " + remote_address + ": " + message.str());

    return makeError(413, message.str());
}

//=============================================================================================
HttpResponse RelayRequestHandler::handleMalformed(const std::string& remote_address,
                                                  const std::string& error)
{
    counters.requests_total++;
    counters.validation_errors++;

    log.write("ERROR - Malformed request from " + remote_address + ": " + error);

    return makeError(400, "Malformed HTTP request");
}

//=============================================================================================
const RelayCounters& RelayRequestHandler::getCounters() const
{
    return counters;
}

//=============================================================================================
const RelayServerConfig& RelayRequestHandler::getConfig() const
{
    return config;
}

//=============================================================================================
bool RelayRequestHandler::admit(const HttpRequest& request,
                                const std::string& remote_address,
                                Endpoint&          endpoint,
                                HttpResponse&      response)
{
    counters.requests_total++;

    const std::string path = getPath(request.target());
    http::verb allowed_method;

    if (path == "/health")
    {
        endpoint = ENDPOINT_HEALTH;
        allowed_method = http::verb::get;
    }
    else if (path == "/wol")
    {
        endpoint = ENDPOINT_WOL;
        allowed_method = http::verb::post;
    }
    else if (path == "/status")
    {
        endpoint = ENDPOINT_STATUS;
        allowed_method = http::verb::get;
    }
    else
    {
        response = makeError(404, "Endpoint not found");
        return false;
    }

    if (request.method() != allowed_method)
    {
        response = makeError(405, "Method not allowed");
        response.set(http::field::allow, http::to_string(allowed_method));
        return false;
    }

    if (endpoint != ENDPOINT_HEALTH && !isAuthorized(request))
    {
        counters.authentication_failures++;
        log.write("ERROR - Rejected unauthenticated " + toString(request.method_string()) +
                  " " + path + " from " + remote_address);

        response = makeError(401, "API key missing or invalid");
        return false;
    }

    return true;
}

//=============================================================================================
bool RelayRequestHandler::isAuthorized(const HttpRequest& request) const
{
    if (config.api_key.empty())
    {
        return true;
    }

    HttpRequest::const_iterator api_key = request.find(API_KEY_HEADER);

    return api_key != request.end() &&
        constantTimeEquals(toString(api_key->value()), config.api_key);
}

//=============================================================================================
HttpResponse RelayRequestHandler::handleHealth()
{
    const std::chrono::seconds uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time);

    Json::Value body(Json::objectValue);
    body["status"]         = "ok";
    body["server"]         = SERVER_NAME;
    body["version"]        = VERSION;
    body["uptime_seconds"] = static_cast<Json::UInt64>(uptime.count());
    body["requests_total"] = static_cast<Json::UInt64>(counters.requests_total);

    return makeResponse(200, body);
}

//=============================================================================================
bool RelayRequestHandler::validateWake(const HttpRequest& request,
                                       const std::string& remote_address,
                                       HttpResponse&      response,
                                       WakeOrder&         order)
{
    if (!isJsonContentType(request[http::field::content_type]))
    {
        response = rejectRequest(remote_address, "Content-Type must be application/json");
        return false;
    }

    if (request.body().empty())
    {
        response = rejectRequest(remote_address, "Request body is empty");
        return false;
    }

    Json::Value payload;
    std::string parse_error;
    if (!jsonBody::parseObject(request.body(), payload, parse_error))
    {
        response = rejectRequest(remote_address, "Request body must be a JSON object");
        return false;
    }

    if (!payload.isMember("mac") || !payload["mac"].isString())
    {
        response = rejectRequest(remote_address, "Field \"mac\" is required");
        return false;
    }

    MacAddress mac_address;
    if (!macAddressText::parse(payload["mac"].asString(), mac_address, parse_error))
    {
        response = rejectRequest(remote_address, "Invalid MAC address format");
        return false;
    }

    if (!networkAddresses::isUsableWakeAddress(mac_address))
    {
        response = rejectRequest(remote_address, "MAC address cannot be woken");
        return false;
    }

    // An empty ip is the same as none
    std::string target_ip;
    if (payload.isMember("ip") && !payload["ip"].isNull())
    {
        if (!payload["ip"].isString())
        {
            response = rejectRequest(remote_address, "Field \"ip\" must be a string");
            return false;
        }

        target_ip = payload["ip"].asString();
        if (!target_ip.empty() && !networkAddresses::isUsableTargetIpv4(target_ip))
        {
            response = rejectRequest(remote_address, "Invalid target IP address");
            return false;
        }
    }

    std::string name = "Unknown";
    if (payload.isMember("name") && !payload["name"].isNull())
    {
        if (!payload["name"].isString())
        {
            response = rejectRequest(remote_address, "Field \"name\" must be a string");
            return false;
        }

        if (payload["name"].asString().length() > MAX_NAME_LENGTH)
        {
            std::ostringstream message;
            message << "Field \"name\" exceeds " << MAX_NAME_LENGTH << " characters";
            response = rejectRequest(remote_address, message.str());
            return false;
        }

        if (!payload["name"].asString().empty())
        {
            name = payload["name"].asString();
        }
    }

    log.write("WoL request from " + remote_address + " for " + name + " (" +
              macAddressText::format(mac_address) + ") IP: " +
              (target_ip.empty() ? "none" : target_ip));

    order.mac_address = mac_address;
    order.target_ip   = target_ip;
    order.name        = name;

    return true;
}

//=============================================================================================
HttpResponse RelayRequestHandler::handleStatus()
{
    const std::chrono::seconds uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time);

    Json::Value body(Json::objectValue);
    body["status"]                  = "running";
    body["server"]                  = SERVER_NAME;
    body["version"]                 = VERSION;
    body["uptime_seconds"]          = static_cast<Json::UInt64>(uptime.count());
    body["requests_total"]          = static_cast<Json::UInt64>(counters.requests_total);
    body["wakes_sent"]              = static_cast<Json::UInt64>(counters.wakes_sent);
    body["validation_errors"]       = static_cast<Json::UInt64>(counters.validation_errors);
    body["authentication_failures"] =
        static_cast<Json::UInt64>(counters.authentication_failures);
    body["delivery_failures"]       = static_cast<Json::UInt64>(counters.delivery_failures);

    Json::Value configuration(Json::objectValue);
    configuration["listen_address"]     = config.listen_address;
    configuration["port"]               = config.port;
    configuration["api_key_configured"] = !config.api_key.empty();
    configuration["broadcast_ip"]       = config.broadcast_address;
    configuration["interface_broadcast"] = config.interface_broadcast;
    configuration["max_request_size"]   = static_cast<Json::UInt64>(config.max_request_size);
    body["config"] = configuration;

    return makeResponse(200, body);
}

//=============================================================================================
HttpResponse RelayRequestHandler::rejectRequest(const std::string& remote_address,
                                                const std::string& message)
{
    counters.validation_errors++;
    log.write("ERROR - Rejected request from " + remote_address + ": " + message);

    return makeError(400, message);
}

//=============================================================================================
HttpResponse RelayRequestHandler::makeResponse(int status_code, const Json::Value& body)
{
    HttpResponse response(static_cast<http::status>(status_code), 11);
    response.set(http::field::content_type, "application/json");
    response.set(http::field::server, SERVER_NAME);
    response.body() = jsonBody::write(body);
    response.keep_alive(false);
    response.prepare_payload();

    return response;
}

//=============================================================================================
HttpResponse RelayRequestHandler::makeError(int status_code, const std::string& message)
{
    Json::Value body(Json::objectValue);
    body["status"] = "error";
    body["error"]  = message;

    return makeResponse(status_code, body);
}

//=============================================================================================
bool RelayRequestHandler::isJsonContentType(const boost::beast::string_view& content_type)
{
    // Parameters such as charset are allowed
    std::string media_type = toString(content_type);
    media_type = media_type.substr(0, media_type.find(';'));

    const std::size_t first = media_type.find_first_not_of(" \t");
    const std::size_t last  = media_type.find_last_not_of(" \t");
    if (first == std::string::npos)
    {
        return false;
    }
    media_type = media_type.substr(first, last - first + 1);

    for (std::string::iterator i = media_type.begin(); i != media_type.end(); ++i)
    {
        *i = static_cast<char>(std::tolower(static_cast<unsigned char>(*i)));
    }

    return media_type == "application/json";
}
