#include "core/config_loader.h"
#include "core/logger.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole-string integer parse; anything that does not fit T is rejected.
template <typename T>
T parseNumber(const std::string& key, const std::string& raw) {
    const std::string value = trim(raw);
    try {
        size_t pos = 0;
        long long n = std::stoll(value, &pos);
        if (pos != value.size() ||
            n < static_cast<long long>(std::numeric_limits<T>::min()) ||
            n > static_cast<long long>(std::numeric_limits<T>::max())) {
            throw std::out_of_range(value);
        }
        return static_cast<T>(n);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid numeric value for parameter " + key + ": '" + raw + "'");
    }
}

const std::set<std::string>& knownWorkerParameters() {
    static const std::set<std::string> keys = {
        "maxDeliveryAttempts", "retryInterval", "retryIntervalMs", "interval",
        "pollInterval", "startupDelay", "replySequence", "faultSequence",
        "deactivateSequence", "targetEndpoint", "throttle", "deactivatedAtStartup",
        "cronExpression", "throttleInterval", "nonRetryStatusCodes", "maxDeliveryDrop",
    };
    return keys;
}

bool parseBool(const std::string& key, const std::string& raw) {
    const std::string value = lower(trim(raw));
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw std::runtime_error("Invalid boolean value for parameter " + key + ": '" + raw + "'");
}

std::vector<std::string> splitCodes(const std::string& raw) {
    std::vector<std::string> out;
    std::stringstream ss(raw);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        // an empty token would match every error text
        if (!token.empty())
            out.push_back(token);
    }
    return out;
}

// Flattens a YAML parameter block into the processor's string parameter map.
std::map<std::string, std::string> toParameterMap(const YAML::Node& node) {
    std::map<std::string, std::string> params;
    if (!node || !node.IsMap())
        return params;

    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        const YAML::Node& v = kv.second;
        if (v.IsSequence()) {
            std::string joined;
            for (const auto& item : v) {
                if (!joined.empty()) joined += ",";
                joined += item.as<std::string>();
            }
            params[key] = joined;
        } else if (v.IsScalar()) {
            params[key] = v.as<std::string>();
        } else {
            throw std::runtime_error("Parameter " + key + " must be a scalar or a list");
        }
    }
    return params;
}

ForwarderConfig parseRoot(const YAML::Node& root) {
    ForwarderConfig cfg;

    if (root["logging"]) {
        auto l = root["logging"];
        if (l["file"])  cfg.logFile  = l["file"].as<std::string>();
        if (l["level"]) cfg.logLevel = l["level"].as<std::string>();
        if (l["max_size_mb"]) cfg.logMaxSizeMb = l["max_size_mb"].as<long>();
        if (l["max_files"])   cfg.logMaxFiles  = l["max_files"].as<int>();
    }

    if (root["endpoints"]) {
        for (const auto& e : root["endpoints"]) {
            Endpoint ep;
            if (e["name"])    ep.name    = e["name"].as<std::string>();
            if (e["address"]) ep.address = e["address"].as<std::string>();
            cfg.endpoints.push_back(ep);
        }
    }

    if (root["processors"]) {
        for (const auto& p : root["processors"]) {
            const std::string name = p["name"] ? p["name"].as<std::string>() : "";
            WorkerConfig wc = ConfigLoader::parseWorkerParameters(name, toParameterMap(p["parameters"]));
            if (p["store"]) wc.storeName = p["store"].as<std::string>();
            cfg.processors.push_back(wc);
        }
    }

    return cfg;
}

} // namespace

ForwarderConfig ConfigLoader::loadFromFile(const std::string& path) {
    ForwarderConfig cfg;

    try {
        cfg = parseRoot(YAML::LoadFile(path));
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to load config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);
    return cfg;
}

ForwarderConfig ConfigLoader::loadFromString(const std::string& yaml) {
    ForwarderConfig cfg;

    try {
        cfg = parseRoot(YAML::Load(yaml));
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to parse config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);
    return cfg;
}

WorkerConfig ConfigLoader::parseWorkerParameters(
    const std::string& processorName,
    const std::map<std::string, std::string>& params
) {
    WorkerConfig cfg;
    cfg.processorName = processorName;

    for (const auto& kv : params) {
        if (!knownWorkerParameters().count(kv.first)) {
            Logger::instance().log(LogLevel::Warn,
                "Processor [" + processorName + "]: unknown parameter " + kv.first + " ignored");
        }
    }

    auto get = [&](const char* key) -> const std::string* {
        auto it = params.find(key);
        return it == params.end() ? nullptr : &it->second;
    };

    // The first spelling wins when both are given.
    auto getEither = [&](const char* key, const char* alias) -> std::pair<const char*, const std::string*> {
        if (auto v = get(key)) return {key, v};
        return {alias, get(alias)};
    };

    if (auto v = get("maxDeliveryAttempts"))
        cfg.maxDeliveryAttempts = parseNumber<int>("maxDeliveryAttempts", *v);

    auto retry = getEither("retryInterval", "retryIntervalMs");
    if (retry.second)
        cfg.retryIntervalMs = parseNumber<int>(retry.first, *retry.second);

    auto poll = getEither("interval", "pollInterval");
    if (poll.second)
        cfg.pollIntervalMs = parseNumber<long>(poll.first, *poll.second);

    if (auto v = get("startupDelay"))
        cfg.startupDelayMs = parseNumber<long>("startupDelay", *v);

    if (auto v = get("replySequence"))      cfg.replySequence = trim(*v);
    if (auto v = get("faultSequence"))      cfg.faultSequence = trim(*v);
    if (auto v = get("deactivateSequence")) cfg.deactivateSequence = trim(*v);
    if (auto v = get("targetEndpoint"))     cfg.targetEndpoint = trim(*v);

    if (auto v = get("throttle"))
        cfg.throttle = parseBool("throttle", *v);
    if (auto v = get("deactivatedAtStartup"))
        cfg.deactivatedAtStartup = parseBool("deactivatedAtStartup", *v);

    if (auto v = get("cronExpression"))
        cfg.cronExpression = trim(*v);

    if (auto v = get("throttleInterval")) {
        if (!cfg.cronExpression.empty()) {
            cfg.throttleIntervalMs = parseNumber<long>("throttleInterval", *v);
        } else {
            Logger::instance().log(LogLevel::Warn,
                "Processor [" + processorName + "]: throttleInterval ignored without cronExpression");
        }
    }

    if (auto v = get("nonRetryStatusCodes"))
        cfg.nonRetryStatusCodes = splitCodes(*v);

    if (auto v = get("maxDeliveryDrop")) {
        if (trim(*v) == "Enabled") {
            if (cfg.maxDeliveryAttempts > 0) {
                cfg.dropOnMaxAttempts = true;
            } else {
                Logger::instance().log(LogLevel::Warn,
                    "Processor [" + processorName + "]: maxDeliveryDrop requires a bounded maxDeliveryAttempts");
            }
        }
    }

    return cfg;
}

void ConfigLoader::validateWorkerConfig(const WorkerConfig& cfg, std::vector<std::string>& errors) {
    const std::string prefix = "processor [" + cfg.processorName + "]: ";

    if (cfg.processorName.empty()) {
        errors.push_back("processor name is required");
    }
    if (cfg.maxDeliveryAttempts < -1) {
        errors.push_back(prefix + "maxDeliveryAttempts must be -1 or greater");
    }
    if (cfg.retryIntervalMs < 0) {
        errors.push_back(prefix + "retryInterval must not be negative");
    }
    if (cfg.pollIntervalMs < 0) {
        errors.push_back(prefix + "interval must not be negative");
    }
    if (cfg.startupDelayMs < 0) {
        errors.push_back(prefix + "startupDelay must not be negative");
    }
    if (!cfg.cronExpression.empty() && cfg.throttleIntervalMs < -1) {
        errors.push_back(prefix + "throttleInterval must be -1 or greater");
    }
}

void ConfigLoader::validateConfig(const ForwarderConfig& cfg) {
    std::vector<std::string> errors;

    // Log level validation
    std::vector<std::string> validLevels = {"debug", "info", "warn", "warning", "error", "fatal"};
    if (std::find(validLevels.begin(), validLevels.end(), cfg.logLevel) == validLevels.end()) {
        errors.push_back("logging.level must be one of: debug, info, warn, error, fatal");
    }
    if (cfg.logMaxSizeMb <= 0) {
        errors.push_back("logging.max_size_mb must be positive");
    }
    if (cfg.logMaxFiles < 1) {
        errors.push_back("logging.max_files must be at least 1");
    }

    std::set<std::string> endpointNames;
    for (const auto& ep : cfg.endpoints) {
        if (ep.name.empty()) {
            errors.push_back("endpoint name is required");
        } else if (!endpointNames.insert(ep.name).second) {
            errors.push_back("duplicate endpoint name: " + ep.name);
        }
        if (ep.address.empty()) {
            errors.push_back("endpoint [" + ep.name + "]: address is required");
        }
    }

    std::set<std::string> processorNames;
    for (const auto& p : cfg.processors) {
        validateWorkerConfig(p, errors);
        if (!p.processorName.empty() && !processorNames.insert(p.processorName).second) {
            errors.push_back("duplicate processor name: " + p.processorName);
        }
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        Logger::instance().log(LogLevel::Error, errorMsg);
        throw std::runtime_error("Invalid configuration: " + errorMsg);
    }

    Logger::instance().log(LogLevel::Info, "Configuration validation passed");
}

void ConfigLoader::applyLogging(const ForwarderConfig& cfg) {
    Logger& logger = Logger::instance();
    logger.setLevel(logLevelFromString(cfg.logLevel));
    logger.setRotation(static_cast<size_t>(cfg.logMaxSizeMb) * 1024 * 1024, cfg.logMaxFiles);
    if (!cfg.logFile.empty()) {
        logger.setFile(cfg.logFile);
    }
}
