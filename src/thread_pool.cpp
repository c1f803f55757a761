//
// Created by garrett on 2/23/25.
//


#include "thread_pool.hpp"

ThreadPool::ThreadPool() : m_active(0), m_stop(false) {};

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::enqueue(std::function<void()> task) {
    std::unique_lock lock(m_queue_mutex);
    m_tasks.push(std::move(task));
    m_condition.notify_one();
}

void ThreadPool::start(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lock(m_queue_mutex);
                    m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                    if (m_stop && m_tasks.empty()) {
                        return;
                    }
                    task = std::move(m_tasks.front());
                    m_tasks.pop();
                    ++m_active;
                }
                task();
                {
                    std::unique_lock lock(m_queue_mutex);
                    --m_active;
                    if (m_active == 0 && m_tasks.empty()) {
                        m_idle.notify_all();
                    }
                }
            }
        });
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock lock(m_queue_mutex);
    m_idle.wait(lock, [this] { return m_tasks.empty() && m_active == 0; });
}

void ThreadPool::stop() {
    {
        std::unique_lock lock(m_queue_mutex);
        m_stop = true;
    }
    m_condition.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}
