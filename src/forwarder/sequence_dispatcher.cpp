#include "forwarder/sequence_dispatcher.h"
#include "core/logger.h"

SequenceDispatcher::SequenceDispatcher(
    const SequenceRegistry& registry,
    std::string processorName,
    std::string replySequence,
    std::string faultSequence,
    std::string deactivateSequence
)
    : registry_(registry)
    , processorName_(std::move(processorName))
    , replySequence_(std::move(replySequence))
    , faultSequence_(std::move(faultSequence))
    , deactivateSequence_(std::move(deactivateSequence)) {}

bool SequenceDispatcher::sendThroughReplySeq(Message& message) const {
    return invoke("reply", replySequence_, message);
}

bool SequenceDispatcher::sendThroughFaultSeq(Message& message) const {
    return invoke("fault", faultSequence_, message);
}

bool SequenceDispatcher::sendThroughDeactivateSeq(Message& message) const {
    return invoke("deactivate", deactivateSequence_, message);
}

bool SequenceDispatcher::invoke(const char* kind, const std::string& sequenceName, Message& message) const {
    if (sequenceName.empty()) {
        Logger::instance().log(LogLevel::Warn,
            "[" + processorName_ + "] Failed to send the message through the " + kind +
            " sequence. Sequence name does not exist.");
        return false;
    }

    auto sequence = registry_.find(sequenceName);
    if (!sequence) {
        Logger::instance().log(LogLevel::Warn,
            "[" + processorName_ + "] Failed to send the message through the " + kind +
            " sequence. Sequence [" + sequenceName + "] does not exist.");
        return false;
    }

    sequence->mediate(message);
    return true;
}
