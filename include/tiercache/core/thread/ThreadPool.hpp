#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <future>
#include <optional>
#include <type_traits>

namespace tiercache {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;  // Активные потоки
    size_t queueSize = 0;      // Размер очереди
    size_t totalThreads = 0;   // Всего потоков
    size_t completedTasks = 0; // Выполнено задач
    size_t rejectedTasks = 0;  // Отклонено задач
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 1;     // Мин. потоки
    size_t maxThreads = 4;     // Макс. потоки
    size_t queueSize = 1024;   // Макс. очередь

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков: стартует с minThreads, растёт до maxThreads, когда все заняты
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    bool enqueue(std::function<void()> task); // Добавить задачу (false: очередь полна или пул остановлен)

    // Добавить задачу с результатом; nullopt, если задача отклонена
    template<typename F>
    auto trySubmit(F&& f) -> std::optional<std::future<std::invoke_result_t<std::decay_t<F>>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        auto future = task->get_future();
        if (!enqueue([task]() { (*task)(); })) {
            return std::nullopt;
        }
        return future;
    }

    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул (ожидающие задачи отбрасываются)
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace tiercache
