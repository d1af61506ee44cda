#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "forwarder/message.h"

class EndpointRegistry {
public:
    EndpointRegistry() = default;
    explicit EndpointRegistry(const std::vector<Endpoint>& endpoints);

    void add(const Endpoint& endpoint);
    std::optional<Endpoint> resolve(const std::string& name) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Endpoint> endpoints_;
};
