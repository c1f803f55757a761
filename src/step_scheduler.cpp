//
// Created by garrett on 2/27/25.
//

#include "step_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

StepScheduler::StepScheduler(size_t numThreads) : m_numThreads(numThreads == 0 ? 1 : numThreads) {}

size_t StepScheduler::addTask(std::string name, std::function<void()> task, const std::vector<size_t>& dependencies) {
    size_t id = m_nodes.size();
    for (size_t dependency : dependencies) {
        if (dependency >= id) {
            throw std::invalid_argument("Task " + name + " depends on a task that was not added yet");
        }
    }
    m_nodes.push_back(Node{std::move(name), std::move(task), {}, dependencies.size()});
    for (size_t dependency : dependencies) {
        m_nodes[dependency].dependents.push_back(id);
    }
    return id;
}

void StepScheduler::run() {
    if (m_nodes.empty()) {
        return;
    }

    m_remaining = m_nodes.size();
    ThreadPool pool;
    pool.start(std::min(m_numThreads, m_nodes.size()));

    std::vector<size_t> ready;
    for (size_t id = 0; id < m_nodes.size(); ++id) {
        if (m_nodes[id].pending == 0) {
            ready.push_back(id);
        }
    }
    for (size_t id : ready) {
        pool.enqueue([this, &pool, id] { execute(pool, id); });
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_finished.wait(lock, [this] { return m_remaining == 0; });
    lock.unlock();
    pool.stop();
}

void StepScheduler::execute(ThreadPool& pool, size_t id) {
    Node& node = m_nodes[id];
    spdlog::debug("Starting {}", node.name);
    try {
        node.task();
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", node.name, e.what());
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errors.emplace_back(node.name, e.what());
    }

    std::vector<size_t> ready;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t dependent : node.dependents) {
            if (--m_nodes[dependent].pending == 0) {
                ready.push_back(dependent);
            }
        }
        --m_remaining;
        if (m_remaining == 0) {
            m_finished.notify_all();
        }
    }
    for (size_t next : ready) {
        pool.enqueue([this, &pool, next] { execute(pool, next); });
    }
}
