#include <chrono>
#include <cstddef>
#include <ctime>
#include <deque>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "DispatchLog.hpp"

const char* const DispatchAttempt::METHOD_LOCAL = "local";
const char* const DispatchAttempt::METHOD_RELAY = "relay";

//=============================================================================================
DispatchAttempt::DispatchAttempt() :
    timestamp(std::chrono::system_clock::now()),
    success(false),
    http_status(0)
{
}

//=============================================================================================
DispatchAttempt::DispatchAttempt(const std::string& method,
                                 bool               success,
                                 const std::string& message,
                                 int                http_status) :
    timestamp(std::chrono::system_clock::now()),
    method(method),
    success(success),
    message(message),
    http_status(http_status)
{
}

//=============================================================================================
bool DispatchAttempt::hasHttpStatus() const
{
    return http_status != 0;
}

//=============================================================================================
std::string DispatchAttempt::toString() const
{
    const std::time_t time = std::chrono::system_clock::to_time_t(timestamp);

    std::tm local_time;
    localtime_r(&time, &local_time);

    char time_cstr[32];
    std::strftime(time_cstr, sizeof(time_cstr), "%Y-%m-%d %H:%M:%S", &local_time);

    std::ostringstream out;
    out << time_cstr << " " << method << " " << (success ? "OK" : "FAILED");
    if (hasHttpStatus())
    {
        out << " [HTTP " << http_status << "]";
    }
    out << " " << message;

    return out.str();
}

//=============================================================================================
DispatchLog::DispatchLog(std::size_t capacity) :
    capacity(capacity)
{
}

//=============================================================================================
DispatchLog::~DispatchLog()
{
}

//=============================================================================================
void DispatchLog::append(const DispatchAttempt& attempt)
{
    std::lock_guard<std::mutex> lock(entries_mutex);

    entries.push_back(attempt);
    while (entries.size() > capacity)
    {
        entries.pop_front();
    }
}

//=============================================================================================
std::vector<DispatchAttempt> DispatchLog::getEntries() const
{
    std::lock_guard<std::mutex> lock(entries_mutex);
    return std::vector<DispatchAttempt>(entries.begin(), entries.end());
}

//=============================================================================================
bool DispatchLog::getLatest(DispatchAttempt& attempt) const
{
    std::lock_guard<std::mutex> lock(entries_mutex);

    if (entries.empty())
    {
        return false;
    }

    attempt = entries.back();
    return true;
}

//=============================================================================================
std::size_t DispatchLog::size() const
{
    std::lock_guard<std::mutex> lock(entries_mutex);
    return entries.size();
}

//=============================================================================================
std::size_t DispatchLog::getCapacity() const
{
    return capacity;
}
