#pragma once
#include <optional>

#include "forwarder/message.h"
#include "forwarder/message_sender.h"
#include "forwarder/outcome_classifier.h"

// One synchronous send of a working copy through the transport.
class DeliveryAttempt {
public:
    DeliveryAttempt(MessageSender& sender, const OutcomeClassifier& classifier);

    // Throws whatever the sender throws (DeliveryError for transport failures).
    std::optional<Message> attempt(Message& workingCopy, const Endpoint& endpoint);

private:
    MessageSender& sender_;
    std::string nonErrorStatusCodes_;
};
