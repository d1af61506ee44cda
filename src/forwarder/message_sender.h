#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "forwarder/message.h"

// Raised by a sender when the exchange with the endpoint failed.
// cause() carries the transport's error text (status line, socket error, ...).
class DeliveryError : public std::runtime_error {
public:
    DeliveryError(const std::string& what, const std::string& cause)
        : std::runtime_error(what), cause_(cause) {}

    explicit DeliveryError(const std::string& what)
        : std::runtime_error(what), cause_(what) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

class MessageSender {
public:
    virtual ~MessageSender() = default;

    // Performs one blocking exchange. Returns the response for a two-way
    // exchange, nullopt for a completed one-way exchange.
    virtual std::optional<Message> send(const Endpoint& endpoint, Message& message) = 0;
};
