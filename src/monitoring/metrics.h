#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <mutex>

// Process-wide counters for the forwarding workers.
class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& name, int value = 1);
    void set(const std::string& name, int64_t value);
    int64_t get(const std::string& name) const;

    std::string renderPrometheus() const;

private:
    Metrics() = default;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> counters_;
};
