#include "forwarder/delivery_attempt.h"

DeliveryAttempt::DeliveryAttempt(MessageSender& sender, const OutcomeClassifier& classifier)
    : sender_(sender) {
    for (int code : classifier.nonErrorHttpStatusCodes()) {
        if (!nonErrorStatusCodes_.empty())
            nonErrorStatusCodes_ += ",";
        nonErrorStatusCodes_ += std::to_string(code);
    }
}

std::optional<Message> DeliveryAttempt::attempt(Message& workingCopy, const Endpoint& endpoint) {
    workingCopy.setProperty(MessageProperty::NonErrorHttpStatusCodes, nonErrorStatusCodes_);
    return sender_.send(endpoint, workingCopy);
}
