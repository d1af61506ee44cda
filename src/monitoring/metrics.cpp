#include "monitoring/metrics.h"
#include <map>
#include <sstream>

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

void Metrics::inc(const std::string& name, int value) {
    std::lock_guard<std::mutex> lk(mutex_);
    counters_[name] += value;
}

void Metrics::set(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lk(mutex_);
    counters_[name] = value;
}

int64_t Metrics::get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::string Metrics::renderPrometheus() const {
    std::lock_guard<std::mutex> lk(mutex_);
    // sorted output keeps scrapes stable
    std::map<std::string, int64_t> sorted(counters_.begin(), counters_.end());

    std::ostringstream out;
    for (const auto& p : sorted) {
        out << p.first << " " << p.second << "\n";
    }
    return out.str();
}
