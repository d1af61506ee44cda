#include "forwarder/retry_policy.h"

const char* toString(RetryVerdict verdict) {
    switch (verdict) {
        case RetryVerdict::WillRetry:   return "WillRetry";
        case RetryVerdict::Dropped:     return "Dropped";
        case RetryVerdict::Deactivated: return "Deactivated";
        case RetryVerdict::Skipped:     return "Skipped";
        default:                        return "Unknown";
    }
}

RetryPolicy::RetryPolicy(int maxDeliveryAttempts, int retryIntervalMs, bool dropOnMaxAttempts)
    : maxDeliveryAttempts_(maxDeliveryAttempts)
    , retryInterval_(retryIntervalMs < 0 ? 0 : retryIntervalMs)
    , dropOnMaxAttempts_(dropOnMaxAttempts && maxDeliveryAttempts > 0) {}

RetryDecision RetryPolicy::onFailure(WorkerState& state, bool terminated) const {
    if (terminated)
        return {RetryVerdict::Skipped, std::chrono::milliseconds(0)};

    if (bounded()) {
        ++state.attemptCount;
        if (state.attemptCount >= maxDeliveryAttempts_) {
            if (dropOnMaxAttempts_) {
                state.attemptCount = 0;
                state.succeeded = true;
                return {RetryVerdict::Dropped, std::chrono::milliseconds(0)};
            }
            return {RetryVerdict::Deactivated, std::chrono::milliseconds(0)};
        }
    }

    return {RetryVerdict::WillRetry, retryInterval_};
}
