#pragma once

#include <functional>
#include <memory>
#include <chrono>
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ignition {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;   // Активные потоки
    size_t queueSize = 0;       // Размер очереди
    size_t totalThreads = 0;    // Всего потоков
    size_t completedTasks = 0;  // Выполнено задач
    nlohmann::json toJson() const {
        return {
            {"activeThreads", activeThreads},
            {"queueSize", queueSize},
            {"totalThreads", totalThreads},
            {"completedTasks", completedTasks}
        };
    }
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 4;       // Кол-во потоков (фиксировано)
    std::string name = "worker";  // Префикс в логах
    bool validate() const {
        return threadCount > 0 && !name.empty();
    }
    nlohmann::json toJson() const {
        return {{"threadCount", threadCount}, {"name", name}};
    }
    static ThreadPoolConfig fromJson(const nlohmann::json& j) {
        ThreadPoolConfig config;
        config.threadCount = j.value("threadCount", config.threadCount);
        config.name = j.value("name", config.name);
        return config;
    }
};

// Пул потоков фиксированного размера с неограниченной FIFO-очередью
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    bool enqueue(std::function<void()> task); // Добавить задачу (false после stop)
    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    // Остановить пул: очередь сбрасывается, выполняющиеся задачи ждём не дольше grace.
    // Возвращает false, если часть потоков пришлось оставить (detach)
    bool stop(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));
    bool isStopped() const; // Остановлен?
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Реализация, разделяется с рабочими потоками
};

} // namespace thread
} // namespace ignition
