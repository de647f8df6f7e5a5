#include "stop_signal.hpp"
#include <algorithm>

StopSignal::StopSignal(std::chrono::milliseconds poll_slice)
    : poll_slice_(poll_slice)
{}

void StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    cv_.notify_all();
}

bool StopSignal::wait_for(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopped_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, poll_slice_);
        cv_.wait_for(lock, slice, [this] { return stopped_.load(); });
    }
    return false;
}
