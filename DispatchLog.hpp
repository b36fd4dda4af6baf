#if !defined DISPATCH_LOG_HPP
#define DISPATCH_LOG_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Record of one attempt at waking a device
struct DispatchAttempt
{
    static const char* const METHOD_LOCAL;
    static const char* const METHOD_RELAY;

    DispatchAttempt();

    DispatchAttempt(const std::string& method,
                    bool               success,
                    const std::string& message,
                    int                http_status = 0);

    bool hasHttpStatus() const;

    // "YYYY-MM-DD HH:MM:SS <method> <OK|FAILED> [HTTP <status>] <message>" in local time
    std::string toString() const;

    std::chrono::system_clock::time_point timestamp;

    // METHOD_LOCAL or METHOD_RELAY
    std::string method;

    bool success;

    std::string message;

    // Zero when no HTTP response was involved
    int http_status;
};

// Fixed-capacity history of dispatch attempts; once full, each append evicts the oldest entry
class DispatchLog
{
public:

    static const std::size_t DEFAULT_CAPACITY = 10;

    explicit DispatchLog(std::size_t capacity = DEFAULT_CAPACITY);

    ~DispatchLog();

    void append(const DispatchAttempt& attempt);

    // Oldest first
    std::vector<DispatchAttempt> getEntries() const;

    // Returns false if nothing has been appended yet
    bool getLatest(DispatchAttempt& attempt) const;

    std::size_t size() const;

    std::size_t getCapacity() const;

private:

    std::size_t capacity;

    std::deque<DispatchAttempt> entries;

    mutable std::mutex entries_mutex;

    DispatchLog(const DispatchLog&);
    DispatchLog& operator=(const DispatchLog&);
};

#endif
