#include "thread_pool.hpp"

#include <algorithm>

namespace calc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = std::max(1u, std::thread::hardware_concurrency());
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this]() { return tasks.empty() && active == 0; });
}

std::size_t ThreadPool::pending() {
    std::lock_guard<std::mutex> lock(mutex);
    return tasks.size() + active;
}

void ThreadPool::finishTask() {
    std::lock_guard<std::mutex> lock(mutex);
    --active;
    if (active == 0 && tasks.empty()) {
        idle.notify_all();
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            condition.wait(lock, [this]() { return stop || !tasks.empty(); });

            // Остановка только после опустошения очереди
            if (tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
            ++active;
        }

        // packaged_task сохраняет исключение в future, здесь оно не возникает
        task();
        finishTask();
    }
}

} // namespace calc
