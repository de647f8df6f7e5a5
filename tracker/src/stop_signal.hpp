#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shutdown flag shared by the tracker loop, the backoff waits and the
// signal handlers. Waits wake up on request_stop() immediately and poll the
// flag every `poll_slice`, so a stop raised from a signal handler (which may
// only touch the atomic) is seen within one slice.
class StopSignal {
public:
    explicit StopSignal(std::chrono::milliseconds poll_slice = std::chrono::milliseconds(250));

    void request_stop();
    // Async-signal-safe, only stores the flag
    void request_stop_from_signal() { stopped_.store(true); }
    bool stop_requested() const { return stopped_.load(); }

    // Returns true if the full duration elapsed, false if a stop was requested
    bool wait_for(std::chrono::milliseconds duration);

private:
    std::chrono::milliseconds poll_slice_;
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
