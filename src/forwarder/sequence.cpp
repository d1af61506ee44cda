#include "forwarder/sequence.h"

#include <stdexcept>

void SequenceRegistry::add(std::shared_ptr<Sequence> sequence) {
    if (!sequence) {
        throw std::invalid_argument("SequenceRegistry: null sequence");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sequences_[sequence->name()] = std::move(sequence);
}

void SequenceRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    sequences_.erase(name);
}

std::shared_ptr<Sequence> SequenceRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sequences_.find(name);
    return it == sequences_.end() ? nullptr : it->second;
}
