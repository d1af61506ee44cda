#pragma once
#include <chrono>

#include "forwarder/worker_state.h"

enum class RetryVerdict {
    WillRetry,      // sleep delay, then attempt again
    Dropped,        // attempts exhausted, message is discarded
    Deactivated,    // attempts exhausted, worker stops
    Skipped         // worker already terminated
};

struct RetryDecision {
    RetryVerdict verdict = RetryVerdict::WillRetry;
    std::chrono::milliseconds delay{0};
};

const char* toString(RetryVerdict verdict);

class RetryPolicy {
public:
    RetryPolicy(int maxDeliveryAttempts, int retryIntervalMs, bool dropOnMaxAttempts);

    // Records one failed attempt in state and decides what happens next.
    // Dropped also resets the attempt count and marks the cycle finished.
    RetryDecision onFailure(WorkerState& state, bool terminated) const;

    bool bounded() const { return maxDeliveryAttempts_ > 0; }
    int maxDeliveryAttempts() const { return maxDeliveryAttempts_; }
    std::chrono::milliseconds retryInterval() const { return retryInterval_; }

private:
    int maxDeliveryAttempts_;
    std::chrono::milliseconds retryInterval_;
    bool dropOnMaxAttempts_;
};
