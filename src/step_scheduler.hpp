//
// Created by garrett on 2/27/25.
//

#ifndef STEP_SCHEDULER_HPP
#define STEP_SCHEDULER_HPP

#include "thread_pool.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Dependency graph of tasks run on a worker pool. A task starts once all the tasks
// it depends on have finished, whatever their outcome; independent tasks run in parallel.
class StepScheduler {
public:
    explicit StepScheduler(size_t numThreads);

    /// @brief Add a task; dependencies must refer to tasks added earlier
    /// @return id of the task
    size_t addTask(std::string name, std::function<void()> task, const std::vector<size_t>& dependencies = {});

    /// @brief Run every task and wait for all of them. Exceptions thrown by a task are
    /// logged and kept in errors().
    void run();

    // Task name and message for each task that threw
    const std::vector<std::pair<std::string, std::string>>& errors() const { return m_errors; }

    size_t size() const { return m_nodes.size(); }

private:
    struct Node {
        std::string name;
        std::function<void()> task;
        std::vector<size_t> dependents;
        size_t pending{0};
    };

    size_t m_numThreads;
    std::vector<Node> m_nodes;
    std::vector<std::pair<std::string, std::string>> m_errors;
    std::mutex m_mutex;
    std::condition_variable m_finished;
    size_t m_remaining{0};

    void execute(ThreadPool& pool, size_t id);
};

#endif // STEP_SCHEDULER_HPP
