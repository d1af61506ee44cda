#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "forwarder/message.h"

// A mediation sequence run on a message after delivery (reply, fault, deactivate).
class Sequence {
public:
    virtual ~Sequence() = default;

    virtual std::string name() const = 0;
    virtual void mediate(Message& message) = 0;
};

class FunctionSequence : public Sequence {
public:
    FunctionSequence(std::string name, std::function<void(Message&)> fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    void mediate(Message& message) override { fn_(message); }

private:
    std::string name_;
    std::function<void(Message&)> fn_;
};

class SequenceRegistry {
public:
    void add(std::shared_ptr<Sequence> sequence);
    void remove(const std::string& name);

    // nullptr when no sequence is registered under the name
    std::shared_ptr<Sequence> find(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Sequence>> sequences_;
};
