#pragma once
#include <string>

#include "forwarder/message.h"
#include "forwarder/sequence.h"

// Runs the configured reply/fault/deactivate sequence on a message.
// Sequences are looked up by name on every call so that redeployed
// sequences are picked up without restarting the worker.
class SequenceDispatcher {
public:
    SequenceDispatcher(
        const SequenceRegistry& registry,
        std::string processorName,
        std::string replySequence,
        std::string faultSequence,
        std::string deactivateSequence);

    bool sendThroughReplySeq(Message& message) const;
    bool sendThroughFaultSeq(Message& message) const;
    bool sendThroughDeactivateSeq(Message& message) const;

private:
    bool invoke(const char* kind, const std::string& sequenceName, Message& message) const;

    const SequenceRegistry& registry_;
    std::string processorName_;
    std::string replySequence_;
    std::string faultSequence_;
    std::string deactivateSequence_;
};
