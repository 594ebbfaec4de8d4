#pragma once

#include <string>
#include <functional>
#include <optional>
#include <chrono>
#include <exception>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "ignition/common/CancellationToken.hpp"
#include "ignition/thread/ThreadPool.hpp"

namespace ignition {
namespace scheduler {

using TaskId = std::string;
using Clock = std::chrono::steady_clock;

// Статус задачи: Pending -> Running -> {Completed, Failed, Cancelled}
enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

inline const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

// TaskSnapshot: копия состояния задачи для callbacks и наблюдения
struct TaskSnapshot {
    TaskId id;
    TaskStatus status = TaskStatus::Pending;
    double progress = 0.0;
    std::string message;
    bool hasResult = false;
    std::exception_ptr error;
    Clock::time_point submitTime;
    std::optional<Clock::time_point> startTime;
    std::optional<Clock::time_point> endTime;

    // Длительность выполнения, если задача стартовала
    std::optional<std::chrono::milliseconds> duration() const {
        if (!startTime) return std::nullopt;
        auto end = endTime ? *endTime : Clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - *startTime);
    }

    nlohmann::json toJson() const;
};

using ProgressCallback = std::function<void(const TaskSnapshot&)>;

// TaskContext: то, что видит работа во время выполнения
class TaskContext {
public:
    using Reporter = std::function<void(double, const std::string&)>;

    TaskContext(TaskId id, CancellationToken token, Reporter reporter)
        : id_(std::move(id)), token_(std::move(token)), reporter_(std::move(reporter)) {}

    const TaskId& id() const { return id_; }
    const CancellationToken& token() const { return token_; }
    bool isCancelled() const { return token_.isCancelled(); }
    void throwIfCancelled() const { token_.throwIfCancelled(); }

    // Сообщить прогресс [0,1]; значения вне диапазона обрезаются
    void reportProgress(double fraction, const std::string& message = "") const {
        if (reporter_) reporter_(fraction, message);
    }

private:
    TaskId id_;
    CancellationToken token_;
    Reporter reporter_;
};

// Параметры отправки задачи
struct SubmitOptions {
    std::optional<std::string> name;                      // Имя (генерируется, если пусто)
    ProgressCallback onProgress;                          // Callback прогресса
    std::optional<std::chrono::milliseconds> queueTimeout; // Макс. время в очереди
};

// SchedulerConfig: параметры планировщика
struct SchedulerConfig {
    thread::ThreadPoolConfig pool;                                          // Пул потоков
    std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds(5000); // Ожидание при shutdown
    std::chrono::milliseconds retention = std::chrono::seconds(3600);       // Хранение завершённых задач
    bool validate() const {
        return pool.validate() && shutdownGrace.count() >= 0 && retention.count() >= 0;
    }
    nlohmann::json toJson() const {
        return {
            {"pool", pool.toJson()},
            {"shutdownGraceMs", shutdownGrace.count()},
            {"retentionMs", retention.count()}
        };
    }
    static SchedulerConfig fromJson(const nlohmann::json& j) {
        SchedulerConfig config;
        if (j.contains("pool")) config.pool = thread::ThreadPoolConfig::fromJson(j.at("pool"));
        config.shutdownGrace = std::chrono::milliseconds(j.value("shutdownGraceMs", config.shutdownGrace.count()));
        config.retention = std::chrono::milliseconds(j.value("retentionMs", config.retention.count()));
        return config;
    }
};

// Метрики планировщика (кол-во задач по статусам)
struct SchedulerMetrics {
    size_t pending = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    size_t totalSubmitted = 0;   // Всего принято задач
    size_t debounceTimers = 0;   // Активные debounce-таймеры
    thread::ThreadPoolMetrics pool;
    size_t total() const { return pending + running + completed + failed + cancelled; }
    nlohmann::json toJson() const {
        return {
            {"total", total()},
            {"pending", pending},
            {"running", running},
            {"completed", completed},
            {"failed", failed},
            {"cancelled", cancelled},
            {"totalSubmitted", totalSubmitted},
            {"debounceTimers", debounceTimers},
            {"pool", pool.toJson()}
        };
    }
};

} // namespace scheduler
} // namespace ignition
