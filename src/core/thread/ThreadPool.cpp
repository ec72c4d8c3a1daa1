#include "tiercache/core/thread/ThreadPool.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include <stdexcept>

namespace tiercache {
namespace core {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskCv;
    std::condition_variable doneCv;
    size_t activeTasks = 0;
    size_t completedTasks = 0;
    size_t rejectedTasks = 0;
    bool stopping = false;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    // Вызывается под mutex
    void spawnWorker() {
        workers.emplace_back([this] { workerLoop(); });
    }

    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                taskCv.wait(lock, [this] { return stopping || !tasks.empty(); });
                if (stopping) return;
                task = std::move(tasks.front());
                tasks.pop();
                ++activeTasks;
            }
            try {
                task();
            } catch (const std::exception& e) {
                logging::getLogger()->error("ThreadPool: задача завершилась исключением: {}", e.what());
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                --activeTasks;
                ++completedTasks;
                if (tasks.empty() && activeTasks == 0) {
                    doneCv.notify_all();
                }
            }
        }
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула потоков");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (size_t i = 0; i < config.minThreads; ++i) {
        pImpl->spawnWorker();
    }
    logging::getLogger()->debug("ThreadPool: запущен: minThreads={}, maxThreads={}, queueSize={}",
                                config.minThreads, config.maxThreads, config.queueSize);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping || pImpl->tasks.size() >= pImpl->config.queueSize) {
            ++pImpl->rejectedTasks;
            return false;
        }
        pImpl->tasks.push(std::move(task));
        // Все потоки заняты: добавляем поток, пока не упёрлись в maxThreads
        if (pImpl->activeTasks + pImpl->tasks.size() > pImpl->workers.size() &&
            pImpl->workers.size() < pImpl->config.maxThreads) {
            pImpl->spawnWorker();
        }
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->activeTasks;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->doneCv.wait(lock, [this] {
        return pImpl->stopping || (pImpl->tasks.empty() && pImpl->activeTasks == 0);
    });
}

void ThreadPool::stop() {
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return;
        }
        pImpl->stopping = true;
        workers.swap(pImpl->workers);
        dropped.swap(pImpl->tasks);
    }
    pImpl->taskCv.notify_all();
    pImpl->doneCv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (!dropped.empty()) {
        logging::getLogger()->debug("ThreadPool: остановлен, отброшено {} задач", dropped.size());
    }
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeTasks;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks;
    metrics.rejectedTasks = pImpl->rejectedTasks;
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace tiercache
