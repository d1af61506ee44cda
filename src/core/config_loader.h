#pragma once

#include <map>
#include <string>
#include <vector>

#include "forwarder/message.h"

// Settings of one forwarding worker. Loaded once, immutable for the run.
struct WorkerConfig {
    std::string processorName;
    std::string storeName;

    int maxDeliveryAttempts = -1;       // -1 retries forever
    int retryIntervalMs = 1000;
    long pollIntervalMs = 1000;
    bool throttle = true;
    std::string cronExpression;
    long throttleIntervalMs = -1;       // only set together with cronExpression
    std::vector<std::string> nonRetryStatusCodes;
    bool dropOnMaxAttempts = false;
    std::string targetEndpoint;
    std::string replySequence;
    std::string faultSequence;
    std::string deactivateSequence;
    bool deactivatedAtStartup = false;
    long startupDelayMs = 5000;

    bool cronMode() const {
        return !cronExpression.empty() && throttleIntervalMs > -1;
    }
};

struct ForwarderConfig {
    std::string logFile;
    std::string logLevel = "info";
    long logMaxSizeMb = 100;
    int logMaxFiles = 6;

    std::vector<Endpoint> endpoints;
    std::vector<WorkerConfig> processors;
};

class ConfigLoader {
public:
    static ForwarderConfig loadFromFile(const std::string& path);
    static ForwarderConfig loadFromString(const std::string& yaml);

    // Builds a worker config from a processor's raw parameter map.
    static WorkerConfig parseWorkerParameters(
        const std::string& processorName,
        const std::map<std::string, std::string>& params);

    static void validateConfig(const ForwarderConfig& cfg);

    // Points the process logger at the configured level, file and rotation.
    static void applyLogging(const ForwarderConfig& cfg);
    static void validateWorkerConfig(const WorkerConfig& cfg, std::vector<std::string>& errors);
};
