#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <boost/beast/http.hpp>
#include <json/json.h>

#include "RelayClient.hpp"

#include "CancellationToken.hpp"
#include "HttpMessage.hpp"
#include "HttpTransport.hpp"
#include "JsonBody.hpp"
#include "Log.hpp"
#include "MacAddress.hpp"
#include "MacAddressText.hpp"
#include "RelayConfig.hpp"
#include "RetryPolicy.hpp"
#include "WakeTarget.hpp"

const char* const RelayClient::HEALTH_PATH    = "/health";
const char* const RelayClient::WAKE_PATH      = "/wol";
const char* const RelayClient::API_KEY_HEADER = "X-API-Key";
const char* const RelayClient::USER_AGENT     = "wakesend/1.0";

const HttpTimeouts RelayClient::HEALTH_CHECK_TIMEOUTS(std::chrono::seconds(8),
                                                      std::chrono::seconds(15));
const HttpTimeouts RelayClient::WAKE_REQUEST_TIMEOUTS(std::chrono::seconds(10),
                                                      std::chrono::seconds(25));

namespace http = boost::beast::http;

//=============================================================================================
RelayClient::Outcome::Outcome() :
    success(false),
    cancelled(false),
    health_check_passed(false),
    wake_requests(0),
    http_status(0)
{
}

//=============================================================================================
RelayClient::StatusAction RelayClient::classifyStatus(int status_code)
{
    if (status_code == 200 || status_code == 202 || status_code == 204)
    {
        return ACCEPT;
    }
    else if (status_code == 401 || status_code == 403)
    {
        return AUTHENTICATION_FAILURE;
    }
    else if (status_code == 429)
    {
        return RATE_LIMITED;
    }
    else if (status_code >= 400 && status_code <= 499)
    {
        return CLIENT_ERROR;
    }
    else if (status_code >= 500 && status_code <= 599)
    {
        return SERVER_ERROR;
    }

    return UNEXPECTED_STATUS;
}

//=============================================================================================
bool RelayClient::isRetryable(StatusAction action)
{
    return action == RATE_LIMITED || action == SERVER_ERROR || action == UNEXPECTED_STATUS;
}

//=============================================================================================
RelayClient::RelayClient(HttpTransport& transport, RetryPolicy& retry_policy, Log& log) :
    transport(transport),
    retry_policy(retry_policy),
    log(log)
{
}

//=============================================================================================
RelayClient::~RelayClient()
{
}

//=============================================================================================
RelayClient::Outcome RelayClient::dispatch(const WakeTarget&        target,
                                           const RelayConfig&       relay,
                                           const CancellationToken& cancellation)
{
    Outcome outcome;

    std::ostringstream relay_name;
    relay_name << relay.host << ":" << relay.port;

    log.write("Issuing WOL for " + target.mac_address + " (" + target.name + ") via relay " +
              relay_name.str());

    // 1. The relay must be up before a wake request is worth sending
    std::string health_message;
    outcome.health_check_passed =
        checkHealth(relay, cancellation, outcome.http_status, health_message);

    if (!outcome.health_check_passed)
    {
        outcome.cancelled = cancellation.isCancelled();
        outcome.message   = "Health check failed: " + health_message;
        log.write("ERROR - " + outcome.message);
        return outcome;
    }

    // 2. Wake request, retried according to the retry policy
    const HttpRequest request = buildWakeRequest(target, relay);

    for (unsigned int attempt = 1; ; attempt++)
    {
        if (cancellation.isCancelled())
        {
            outcome.cancelled = true;
            outcome.message   = "Wake request cancelled";
            log.write(outcome.message);
            return outcome;
        }

        std::ostringstream attempt_label;
        attempt_label << "attempt " << attempt << "/" << RetryPolicy::MAX_ATTEMPTS;

        log.write("Sending wake request to " + relay_name.str() + WAKE_PATH + " (" +
                  attempt_label.str() + ")");

        outcome.wake_requests++;

        HttpResponse response;
        std::string transport_error;
        HttpTransport::Outcome transport_outcome =
            transport.perform(relay.host,
                              static_cast<std::uint16_t>(relay.port),
                              request,
                              WAKE_REQUEST_TIMEOUTS,
                              cancellation,
                              response,
                              transport_error);

        if (transport_outcome == HttpTransport::CANCELLED)
        {
            outcome.cancelled = true;
            outcome.message   = "Wake request cancelled";
            log.write(outcome.message);
            return outcome;
        }

        bool rate_limited = false;

        if (transport_outcome != HttpTransport::COMPLETED)
        {
            // Timeouts and connection trouble are retried like any network error
            outcome.http_status = 0;
            outcome.message = std::string("Relay request ") +
                HttpTransport::describeOutcome(transport_outcome) + ": " + transport_error;
        }
        else
        {
            outcome.http_status = response.result_int();

            std::ostringstream status_text;
            status_text << "HTTP " << response.result_int();

            switch (classifyStatus(response.result_int()))
            {
            case ACCEPT:
                if (response.result_int() == 200)
                {
                    // The status code decides; an odd body is only worth a note
                    Json::Value body;
                    std::string parse_error;
                    if (jsonBody::parseObject(response.body(), body, parse_error) &&
                        body.isMember("status") &&
                        jsonBody::getString(body, "status") != "sent")
                    {
                        log.write("Relay accepted the request with unexpected status \"" +
                                  jsonBody::getString(body, "status") + "\"");
                    }
                }

                outcome.success = true;
                outcome.message = "Wake-on-LAN sent via relay " + relay_name.str();
                log.write(outcome.message + " (" + status_text.str() + ")");
                return outcome;

            case AUTHENTICATION_FAILURE:
                outcome.message = "Relay rejected the API key (" + status_text.str() + ")";
                log.write("ERROR - " + outcome.message);
                return outcome;

            case CLIENT_ERROR:
                outcome.message = "Relay rejected the request (" + status_text.str() + ")";
                log.write("ERROR - " + outcome.message);
                return outcome;

            case RATE_LIMITED:
                rate_limited = true;
                outcome.message = "Relay rate limit reached (" + status_text.str() + ")";
                break;

            case SERVER_ERROR:
                outcome.message = "Relay server error (" + status_text.str() + ")";
                break;

            case UNEXPECTED_STATUS:
                outcome.message = "Unexpected relay response (" + status_text.str() + ")";
                break;
            }
        }

        log.write("ERROR - " + outcome.message + ", " + attempt_label.str());

        if (!retry_policy.shouldRetry(attempt))
        {
            log.write("ERROR - All wake requests to " + relay_name.str() + " failed");
            return outcome;
        }

        const std::chrono::duration<double> delay =
            retry_policy.getDelay(attempt, rate_limited);

        std::ostringstream wait_message;
        wait_message << "Waiting " << std::fixed << std::setprecision(1) << delay.count()
                     << "s before the next wake request";
        log.write(wait_message.str());

        if (!pause(delay, cancellation))
        {
            outcome.cancelled = true;
            outcome.message   = "Wake request cancelled";
            log.write(outcome.message);
            return outcome;
        }
    }
}

//=============================================================================================
bool RelayClient::checkHealth(const RelayConfig&       relay,
                              const CancellationToken& cancellation,
                              int&                     http_status,
                              std::string&             message)
{
    HttpRequest request(http::verb::get, HEALTH_PATH, 11);
    request.set(http::field::accept, "application/json");
    request.set(http::field::user_agent, USER_AGENT);

    HttpResponse response;
    std::string transport_error;
    HttpTransport::Outcome transport_outcome =
        transport.perform(relay.host,
                          static_cast<std::uint16_t>(relay.port),
                          request,
                          HEALTH_CHECK_TIMEOUTS,
                          cancellation,
                          response,
                          transport_error);

    if (transport_outcome != HttpTransport::COMPLETED)
    {
        http_status = 0;
        message = std::string(HttpTransport::describeOutcome(transport_outcome)) + ": " +
            transport_error;
        return false;
    }

    http_status = response.result_int();

    if (response.result_int() != 200)
    {
        std::ostringstream status_message;
        status_message << "relay answered HTTP " << response.result_int();
        message = status_message.str();
        return false;
    }

    Json::Value body;
    std::string parse_error;
    if (!jsonBody::parseObject(response.body(), body, parse_error))
    {
        message = "health response is not a JSON object: " + parse_error;
        return false;
    }

    const std::string status = jsonBody::getString(body, "status");
    if (status != "ok" && status != "healthy")
    {
        message = "relay reported status \"" + status + "\"";
        return false;
    }

    log.write("Relay " + relay.host + " is healthy");
    return true;
}

//=============================================================================================
bool RelayClient::pause(const std::chrono::duration<double>& delay,
                        const CancellationToken&             cancellation)
{
    return cancellation.sleepFor(std::chrono::duration_cast<std::chrono::nanoseconds>(delay));
}

//=============================================================================================
HttpRequest RelayClient::buildWakeRequest(const WakeTarget&  target,
                                          const RelayConfig& relay) const
{
    // The relay gets the canonical form when the address parses; validation happens before
    // dispatch so this is normally always the case
    MacAddress mac;
    std::string parse_error;
    const std::string mac_address =
        macAddressText::parse(target.mac_address, mac, parse_error) ?
        macAddressText::format(mac) : target.mac_address;

    Json::Value body(Json::objectValue);
    body["mac"]  = mac_address;
    body["ip"]   = target.ip_address;
    body["name"] = target.name;

    HttpRequest request(http::verb::post, WAKE_PATH, 11);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");
    request.set(http::field::user_agent, USER_AGENT);

    if (!relay.api_key.empty())
    {
        request.set(API_KEY_HEADER, relay.api_key);
    }

    request.body() = jsonBody::write(body);
    request.prepare_payload();

    return request;
}
