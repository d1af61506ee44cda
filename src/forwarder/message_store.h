#pragma once
#include <memory>
#include <optional>
#include <string>

#include "forwarder/message.h"

// Consumer side of a durable store. One consumer is used by exactly one worker.
class MessageConsumer {
public:
    virtual ~MessageConsumer() = default;

    // Next message, or nullopt when the store is empty.
    virtual std::optional<Message> receive() = 0;

    // Removes the most recently received message from the store.
    virtual bool ack() = 0;

    virtual bool isAlive() const = 0;
};

class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual std::string name() const = 0;
    virtual std::unique_ptr<MessageConsumer> createConsumer() = 0;
};
