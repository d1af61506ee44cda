#include "forwarder/worker_clock.h"

WorkerClock::TimePoint SystemWorkerClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SystemWorkerClock::sleepFor(std::chrono::milliseconds duration, const std::atomic<bool>& cancelled) {
    if (cancelled)
        return false;
    if (duration.count() <= 0)
        return true;

    std::unique_lock<std::mutex> lock(mutex_);
    const unsigned long start = generation_;
    bool interrupted = cv_.wait_for(lock, duration, [&]() {
        return generation_ != start || cancelled;
    });
    return !interrupted;
}

void SystemWorkerClock::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
    }
    cv_.notify_all();
}
