#pragma once
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Reserved property names shared with the store, transport and sequences.
struct MessageProperty {
    static constexpr const char* TargetEndpoint = "TARGET_ENDPOINT";
    static constexpr const char* BlockingSenderError = "BLOCKING_SENDER_ERROR";
    static constexpr const char* ErrorMessage = "ERROR_MESSAGE";
    static constexpr const char* HttpStatus = "HTTP_SC";
    static constexpr const char* NonErrorHttpStatusCodes = "NON_ERROR_HTTP_STATUS_CODES";
};

// A stored message, or a response produced by a two-way exchange.
// Copying deep-copies the JSON body.
struct Message {
    std::string id;
    std::map<std::string, std::string> properties;
    nlohmann::json body;

    std::optional<std::string> property(const std::string& key) const {
        auto it = properties.find(key);
        if (it == properties.end())
            return std::nullopt;
        return it->second;
    }

    bool hasProperty(const std::string& key) const {
        return properties.count(key) > 0;
    }

    void setProperty(const std::string& key, const std::string& value) {
        properties[key] = value;
    }

    void removeProperty(const std::string& key) {
        properties.erase(key);
    }
};

struct Endpoint {
    std::string name;
    std::string address;
};
