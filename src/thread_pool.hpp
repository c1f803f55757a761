//
// Created by garrett on 2/23/25.
//

#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>


class ThreadPool {
private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idle;
    size_t m_active;
    bool m_stop;
public:
    ThreadPool();
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;


    void enqueue(std::function<void()> task);
    void start(size_t num_threads);

    // Block until the queue is empty and no task is running
    void waitIdle();

    // Finish queued tasks, then join all workers
    void stop();
};



#endif // THREAD_POOL_HPP
