#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace powshield {

// Process-wide counters and gauges exported in Prometheus text format.
// Observability only: nothing in the admission path reads these values.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    // Counter with a single label, rendered as name{label="value"}.
    void increment_labeled(const std::string& name, const std::string& label,
                           const std::string& label_value, double value = 1.0) {
        increment_counter(name + "{" + label + "=\"" + label_value + "\"}", value);
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     * Labeled series share one TYPE line with their base name.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        
        std::string last_base;
        for (const auto& [name, val] : counters_) {
            std::string base = name.substr(0, name.find('{'));
            if (base != last_base) {
                ss << "# TYPE " << base << " counter\n";
                last_base = base;
            }
            ss << name << " " << val << "\n";
        }
        
        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }
        
        return ss.str();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

private:
    MetricsRegistry() = default;
    
    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
