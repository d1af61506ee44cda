#pragma once
#include <set>
#include <string>
#include <vector>

#include "forwarder/message.h"

enum class DeliveryOutcome {
    Success,
    RetryableFailure,
    NonRetryableFailure
};

struct DeliveryVerdict {
    DeliveryOutcome outcome = DeliveryOutcome::Success;
    std::string reason;
};

const char* toString(DeliveryOutcome outcome);

// Stateless mapping from transport results to delivery outcomes.
class OutcomeClassifier {
public:
    explicit OutcomeClassifier(
        std::vector<std::string> nonRetryStatusCodes,
        std::vector<std::string> additionalErrorCodes = {"301"});

    // True if any configured non-retry token occurs in the error text.
    // Substring match: "404" also matches "Status 4040".
    bool isNonRetryable(const std::string& errorText) const;

    // 4xx, 5xx, or one of the additional error codes.
    bool isErrorStatus(const std::string& httpStatus) const;

    // Integer-parsable non-retry tokens; the transport must not treat these
    // statuses as hard errors itself.
    std::set<int> nonErrorHttpStatusCodes() const;

    DeliveryVerdict classifyError(const std::string& errorText) const;
    DeliveryVerdict classifyResponse(const Message& response) const;

    const std::vector<std::string>& nonRetryStatusCodes() const { return nonRetryStatusCodes_; }

private:
    std::vector<std::string> nonRetryStatusCodes_;
    std::vector<std::string> additionalErrorCodes_;
};
