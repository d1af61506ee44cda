#pragma once
#include <string>

// The processor that owns a forwarding worker.
class MessageProcessor {
public:
    virtual ~MessageProcessor() = default;

    virtual std::string name() const = 0;
    virtual bool isDeactivated() const = 0;
    virtual void deactivate() = 0;
};
