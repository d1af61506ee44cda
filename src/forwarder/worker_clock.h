#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Time source and sleep primitive for a worker. Every blocking point in the
// worker goes through sleepFor(), so an interrupt always means "proceed".
class WorkerClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~WorkerClock() = default;

    virtual TimePoint now() const = 0;

    // Returns false if the sleep was cut short by interrupt() or if
    // cancelled is (or becomes) set.
    virtual bool sleepFor(std::chrono::milliseconds duration, const std::atomic<bool>& cancelled) = 0;

    virtual void interrupt() {}
};

class SystemWorkerClock : public WorkerClock {
public:
    TimePoint now() const override;
    bool sleepFor(std::chrono::milliseconds duration, const std::atomic<bool>& cancelled) override;

    // Wakes the sleeping thread; the next sleep is not affected.
    void interrupt() override;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    unsigned long generation_ = 0;
};
