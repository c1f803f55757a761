//
// Created by garrett on 2/23/25.
//

#ifndef METRICS_COLLECTOR_HPP
#define METRICS_COLLECTOR_HPP


#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>


// Run metrics: free-form named values plus monotonically increasing counters
// (bytes_sent, steps_completed, sinks_failed, artifacts_verified, ...)
class MetricsCollector {
private:
    struct Metric {
        std::string name;
        std::string value;
        std::chrono::system_clock::time_point timestamp;
    };

    std::vector<Metric> m_metrics;
    std::map<std::string, uint64_t> m_counters;
    std::mutex m_metrics_mutex;



public:

    void recordMetric(const std::string& name, const std::string& value);

    void incrementCounter(const std::string& name, uint64_t delta = 1);

    uint64_t counter(const std::string& name);

    // Write "name: value" lines, counters last, and clear everything
    void collect(std::ostream& out = std::cout);

};



#endif // METRICS_COLLECTOR_HPP
