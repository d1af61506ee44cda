#include "forwarder/endpoint_registry.h"

EndpointRegistry::EndpointRegistry(const std::vector<Endpoint>& endpoints) {
    for (const auto& ep : endpoints) {
        endpoints_[ep.name] = ep;
    }
}

void EndpointRegistry::add(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[endpoint.name] = endpoint;
}

std::optional<Endpoint> EndpointRegistry::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(name);
    if (it == endpoints_.end())
        return std::nullopt;
    return it->second;
}

size_t EndpointRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_.size();
}
