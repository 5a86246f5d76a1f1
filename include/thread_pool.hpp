#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace calc {

// Пул потоков для параллельного выполнения сессий.
// Задачи выполняются в порядке постановки в очередь; деструктор дожидается
// выполнения всех уже поставленных задач.
class ThreadPool {
public:
    // threadCount == 0: по числу аппаратных потоков (не меньше одного)
    explicit ThreadPool(std::size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавляет задачу в очередь.
    // Исключение задачи передаётся через future.
    // Выбрасывает std::runtime_error, если пул уже остановлен.
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    // Блокирует до момента, когда очередь пуста и ни одна задача не выполняется
    void waitIdle();

    // Задачи в очереди и выполняемые сейчас
    std::size_t pending();

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;                  // Защищает tasks, active и stop
    std::condition_variable condition; // Сигнал о новой задаче или остановке
    std::condition_variable idle;      // Сигнал о завершении последней задачи
    std::size_t active = 0;
    bool stop = false;

    void workerLoop();
    void finishTask();
};

template <class Func, class... Args>
inline auto ThreadPool::enqueue(Func&& func, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>> {
    using Return = std::invoke_result_t<Func, Args...>;

    // Аргументы копируются в задачу, как при std::thread
    auto task = std::make_shared<std::packaged_task<Return()>>(
        [call = std::forward<Func>(func),
         bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Return {
            return std::apply(call, std::move(bound));
        });

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}

} // namespace calc
