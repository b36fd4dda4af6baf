#if !defined CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>

// Shared flag telling long-running operations to stop early.  cancel() only stores to a
// lock-free atomic and writes one byte to a pipe, so it may be called from a signal handler.
// Threads in sleepFor() wait on the read end of that pipe and wake the moment it is written.
class CancellationToken
{
public:

    // Throws std::runtime_error if the wake-up pipe can't be created
    CancellationToken();

    ~CancellationToken();

    void cancel();

    bool isCancelled() const;

    // Blocks for duration or until cancelled, whichever comes first.  Returns false if the
    // wait was cut short by cancellation.
    bool sleepFor(const std::chrono::nanoseconds& duration) const;

private:

    std::atomic<bool> cancelled;

    // [0] is polled by sleepers, [1] is written once by cancel(); never drained, so it stays
    // readable after cancellation
    int wake_pipe[2];

    CancellationToken(const CancellationToken&);
    CancellationToken& operator=(const CancellationToken&);
};

#endif
