#include "forwarder/outcome_classifier.h"

#include <algorithm>
#include <stdexcept>

const char* toString(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::Success:             return "Success";
        case DeliveryOutcome::RetryableFailure:    return "RetryableFailure";
        case DeliveryOutcome::NonRetryableFailure: return "NonRetryableFailure";
        default:                                   return "Unknown";
    }
}

OutcomeClassifier::OutcomeClassifier(
    std::vector<std::string> nonRetryStatusCodes,
    std::vector<std::string> additionalErrorCodes
)
    : nonRetryStatusCodes_(std::move(nonRetryStatusCodes))
    , additionalErrorCodes_(std::move(additionalErrorCodes)) {
    nonRetryStatusCodes_.erase(
        std::remove(nonRetryStatusCodes_.begin(), nonRetryStatusCodes_.end(), std::string()),
        nonRetryStatusCodes_.end());
}

bool OutcomeClassifier::isNonRetryable(const std::string& errorText) const {
    for (const auto& code : nonRetryStatusCodes_) {
        if (errorText.find(code) != std::string::npos)
            return true;
    }
    return false;
}

bool OutcomeClassifier::isErrorStatus(const std::string& httpStatus) const {
    if (!httpStatus.empty() && (httpStatus[0] == '4' || httpStatus[0] == '5'))
        return true;
    return std::find(additionalErrorCodes_.begin(), additionalErrorCodes_.end(), httpStatus)
        != additionalErrorCodes_.end();
}

std::set<int> OutcomeClassifier::nonErrorHttpStatusCodes() const {
    std::set<int> codes;
    for (const auto& token : nonRetryStatusCodes_) {
        const auto first = token.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            continue;
        const std::string code = token.substr(first, token.find_last_not_of(" \t\r\n") - first + 1);
        try {
            size_t pos = 0;
            int n = std::stoi(code, &pos);
            if (pos == code.size())
                codes.insert(n);
        } catch (const std::logic_error&) {
            // not a status code; only used for text matching
        }
    }
    return codes;
}

DeliveryVerdict OutcomeClassifier::classifyError(const std::string& errorText) const {
    if (isNonRetryable(errorText))
        return {DeliveryOutcome::NonRetryableFailure, errorText};
    return {DeliveryOutcome::RetryableFailure, errorText};
}

DeliveryVerdict OutcomeClassifier::classifyResponse(const Message& response) const {
    if (response.property(MessageProperty::BlockingSenderError).value_or("") == "true") {
        return classifyError(response.property(MessageProperty::ErrorMessage).value_or(""));
    }

    const std::string status = response.property(MessageProperty::HttpStatus).value_or("");
    if (isErrorStatus(status))
        return {DeliveryOutcome::RetryableFailure, "HTTP status " + status};

    return {DeliveryOutcome::Success, status};
}
