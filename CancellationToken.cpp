#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "CancellationToken.hpp"

//=============================================================================================
CancellationToken::CancellationToken() :
    cancelled(false)
{
    if (pipe(wake_pipe) != 0)
    {
        throw std::runtime_error(std::string("Cannot create cancellation pipe: ") +
                                 std::strerror(errno));
    }

    // cancel() must never block, even from a signal handler
    const int flags = fcntl(wake_pipe[1], F_GETFL);
    if (flags == -1 || fcntl(wake_pipe[1], F_SETFL, flags | O_NONBLOCK) == -1)
    {
        const std::string error = std::strerror(errno);
        close(wake_pipe[0]);
        close(wake_pipe[1]);
        throw std::runtime_error("Cannot configure cancellation pipe: " + error);
    }
}

//=============================================================================================
CancellationToken::~CancellationToken()
{
    close(wake_pipe[0]);
    close(wake_pipe[1]);
}

//=============================================================================================
void CancellationToken::cancel()
{
    if (cancelled.exchange(true))
    {
        return;
    }

    // A full pipe already wakes every sleeper, so a failed write loses nothing
    const char wake_byte = 1;
    ssize_t written = write(wake_pipe[1], &wake_byte, 1);
    static_cast<void>(written);
}

//=============================================================================================
bool CancellationToken::isCancelled() const
{
    return cancelled.load();
}

//=============================================================================================
bool CancellationToken::sleepFor(const std::chrono::nanoseconds& duration) const
{
    const std::chrono::steady_clock::time_point wake_time =
        std::chrono::steady_clock::now() + duration;

    while (!isCancelled())
    {
        const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        if (now >= wake_time)
        {
            return true;
        }

        // Rounded up so the wait never ends before wake_time
        const std::chrono::nanoseconds remaining = wake_time - now;
        const int timeout_ms = static_cast<int>(
            (remaining + std::chrono::milliseconds(1) - std::chrono::nanoseconds(1)) /
            std::chrono::milliseconds(1));

        pollfd wake_fd;
        wake_fd.fd      = wake_pipe[0];
        wake_fd.events  = POLLIN;
        wake_fd.revents = 0;

        // Both a timeout and a wake-up go round the loop again to be rechecked
        if (poll(&wake_fd, 1, timeout_ms) == -1 && errno != EINTR)
        {
            throw std::runtime_error(std::string("Cannot wait for cancellation: ") +
                                     std::strerror(errno));
        }
    }

    return false;
}
