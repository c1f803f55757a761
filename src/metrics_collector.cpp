//
// Created by garrett on 2/23/25.
//

#include "metrics_collector.hpp"

auto MetricsCollector::recordMetric(const std::string &name, const std::string &value) -> void {
    std::lock_guard lock(m_metrics_mutex);
    m_metrics.push_back({name, value, std::chrono::system_clock::now()});
}

auto MetricsCollector::incrementCounter(const std::string &name, uint64_t delta) -> void {
    std::lock_guard lock(m_metrics_mutex);
    m_counters[name] += delta;
}

auto MetricsCollector::counter(const std::string &name) -> uint64_t {
    std::lock_guard lock(m_metrics_mutex);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second;
}

auto MetricsCollector::collect(std::ostream &out) -> void {
    std::lock_guard lock(m_metrics_mutex);
    for (const auto &metric : m_metrics) {
        out << metric.name << ": " << metric.value << std::endl;
    }
    for (const auto &[name, value] : m_counters) {
        out << name << ": " << value << std::endl;
    }
    m_metrics.clear();
    m_counters.clear();
}
