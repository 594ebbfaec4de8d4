#include "ignition/thread/ThreadPool.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace ignition {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskCv;  // Появилась задача / остановка
    std::condition_variable idleCv;  // Очередь опустела и нет активных
    size_t active = 0;
    size_t completed = 0;
    bool stopping = false;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg), logger(logging::getLogger("scheduler")) {}

    static void workerLoop(std::shared_ptr<Impl> impl, size_t index); // Цикл рабочего потока
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : pImpl(std::make_shared<Impl>(config)) {
    if (!config.validate()) {
        throw ConfigurationError("Некорректная конфигурация пула потоков");
    }
    pImpl->workers.reserve(config.threadCount);
    for (size_t i = 0; i < config.threadCount; ++i) {
        auto impl = pImpl;
        pImpl->workers.emplace_back([impl, i]() { Impl::workerLoop(impl, i); });
    }
    pImpl->logger->debug("ThreadPool '{}': запущено {} потоков", config.name, config.threadCount);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping) {
            return false;
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->active;
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
    pImpl->idleCv.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->active == 0;
    });
}

bool ThreadPool::stop(std::chrono::milliseconds grace) {
    size_t dropped = 0;
    bool idle = false;
    {
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return true;
        }
        pImpl->stopping = true;
        dropped = pImpl->tasks.size();
        std::queue<std::function<void()>>().swap(pImpl->tasks);
        pImpl->taskCv.notify_all();
        idle = pImpl->idleCv.wait_for(lock, grace, [this] { return pImpl->active == 0; });
    }
    pImpl->taskCv.notify_all();

    if (dropped > 0) {
        pImpl->logger->warn("ThreadPool '{}': отброшено {} задач из очереди", pImpl->config.name, dropped);
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        workers.swap(pImpl->workers);
    }
    for (auto& worker : workers) {
        if (!worker.joinable()) continue;
        if (idle && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        } else {
            // Поток держит shared_ptr на Impl и завершится сам
            worker.detach();
        }
    }
    if (!idle) {
        pImpl->logger->warn("ThreadPool '{}': выполняющиеся задачи оставлены после {} ms",
                            pImpl->config.name, grace.count());
    }
    return idle;
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stopping;
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->active;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->config.threadCount;
    metrics.completedTasks = pImpl->completed;
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

void ThreadPool::Impl::workerLoop(std::shared_ptr<Impl> impl, size_t index) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(impl->mutex);
            impl->taskCv.wait(lock, [&impl] { return impl->stopping || !impl->tasks.empty(); });
            if (impl->stopping && impl->tasks.empty()) {
                return;
            }
            task = std::move(impl->tasks.front());
            impl->tasks.pop();
            ++impl->active;
        }
        try {
            task();
        } catch (const std::exception& e) {
            impl->logger->error("ThreadPool '{}' #{}: исключение в задаче: {}", impl->config.name, index, e.what());
        } catch (...) {
            impl->logger->error("ThreadPool '{}' #{}: неизвестное исключение в задаче", impl->config.name, index);
        }
        {
            std::lock_guard<std::mutex> lock(impl->mutex);
            --impl->active;
            ++impl->completed;
            if (impl->active == 0 && impl->tasks.empty()) {
                impl->idleCv.notify_all();
            }
        }
    }
}

} // namespace thread
} // namespace ignition
