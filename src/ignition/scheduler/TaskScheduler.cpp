#include "ignition/scheduler/TaskScheduler.hpp"
#include "ignition/scheduler/TimerQueue.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <unordered_map>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <algorithm>

namespace ignition {
namespace scheduler {

nlohmann::json TaskSnapshot::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"status", toString(status)},
        {"progress", progress},
        {"message", message},
        {"hasResult", hasResult}
    };
    if (auto d = duration()) {
        j["durationMs"] = d->count();
    }
    if (error) {
        j["error"] = TaskFailedError::describe(error);
    }
    return j;
}

namespace {

// Запись задачи, принадлежит планировщику
struct TaskRecord {
    TaskId id;
    TaskStatus status = TaskStatus::Pending;
    double progress = 0.0;
    std::string message;
    std::any result;
    bool hasResult = false;
    std::exception_ptr error;
    bool queueTimedOut = false;
    Clock::time_point submitTime = Clock::now();
    std::optional<Clock::time_point> startTime;
    std::optional<Clock::time_point> endTime;
    CancellationToken token;
    std::vector<ProgressCallback> callbacks;
    TimerQueue::TimerId queueTimer = 0;

    TaskSnapshot snapshot() const {
        TaskSnapshot s;
        s.id = id;
        s.status = status;
        s.progress = progress;
        s.message = message;
        s.hasResult = hasResult;
        s.error = error;
        s.submitTime = submitTime;
        s.startTime = startTime;
        s.endTime = endTime;
        return s;
    }
};

// Ограничитель параллелизма для batchSubmit: запускает следующую задачу по завершении предыдущей
struct BatchGate {
    std::mutex mutex;
    std::deque<std::function<void()>> waiting;
    size_t running = 0;
    size_t limit = 1;
};

} // namespace

struct TaskScheduler::Impl : std::enable_shared_from_this<TaskScheduler::Impl> {
    SchedulerConfig config;
    std::unique_ptr<thread::ThreadPool> pool;
    TimerQueue timers;
    std::unordered_map<TaskId, std::shared_ptr<TaskRecord>> tasks;
    std::unordered_map<std::string, TimerQueue::TimerId> debounceTimers;
    mutable std::mutex mutex;
    std::condition_variable completionCv;
    std::atomic<bool> shuttingDown{false};
    std::atomic<uint64_t> counter{0};
    size_t totalSubmitted = 0;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const SchedulerConfig& cfg)
        : config(cfg),
          pool(std::make_unique<thread::ThreadPool>(cfg.pool)),
          logger(logging::getLogger("scheduler")) {}

    TaskId generateId() {
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return "task_" + std::to_string(++counter) + "_" + std::to_string(epoch);
    }

    // Регистрирует запись задачи; в пул не ставит
    std::shared_ptr<TaskRecord> createRecord(const SubmitOptions& options) {
        auto record = std::make_shared<TaskRecord>();
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            throw SchedulerShutdownError();
        }
        if (options.name && !options.name->empty()) {
            auto it = tasks.find(*options.name);
            if (it != tasks.end() && !isTerminal(it->second->status)) {
                throw DuplicateRegistrationError(*options.name);
            }
            record->id = *options.name;
        } else {
            do {
                record->id = generateId();
            } while (tasks.count(record->id) > 0);
        }
        if (options.onProgress) {
            record->callbacks.push_back(options.onProgress);
        }
        tasks[record->id] = record;
        ++totalSubmitted;
        return record;
    }

    void armQueueTimeout(const std::shared_ptr<TaskRecord>& record, std::chrono::milliseconds timeout) {
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<TaskRecord> weakRecord = record;
        auto timerId = timers.schedule(timeout, [weak, weakRecord, timeout]() {
            auto self = weak.lock();
            auto rec = weakRecord.lock();
            if (self && rec) self->expirePending(rec, timeout);
        });
        std::lock_guard<std::mutex> lock(mutex);
        record->queueTimer = timerId;
    }

    void expirePending(const std::shared_ptr<TaskRecord>& record, std::chrono::milliseconds timeout) {
        std::vector<ProgressCallback> callbacks;
        TaskSnapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (record->status != TaskStatus::Pending) return;
            record->status = TaskStatus::Failed;
            record->progress = 1.0;
            record->queueTimedOut = true;
            record->error = std::make_exception_ptr(TaskTimeoutError(record->id, timeout));
            record->endTime = Clock::now();
            callbacks = record->callbacks;
            snapshot = record->snapshot();
        }
        completionCv.notify_all();
        logger->warn("Задача '{}' не стартовала за {} ms", snapshot.id, timeout.count());
        notify(callbacks, snapshot);
    }

    // Обёртка, исполняемая на рабочем потоке
    void execute(const std::shared_ptr<TaskRecord>& record, const Work& work) {
        TimerQueue::TimerId queueTimer = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (record->status != TaskStatus::Pending) {
                return;
            }
            record->status = TaskStatus::Running;
            record->startTime = Clock::now();
            queueTimer = record->queueTimer;
        }
        if (queueTimer != 0) {
            timers.cancel(queueTimer);
        }
        logger->debug("Задача '{}' запущена", record->id);

        std::weak_ptr<Impl> weak = shared_from_this();
        TaskId id = record->id;
        TaskContext context(id, record->token, [weak, id](double fraction, const std::string& message) {
            if (auto self = weak.lock()) self->updateProgress(id, fraction, message);
        });

        try {
            std::any result = work(context);
            finish(record, TaskStatus::Completed, std::move(result), nullptr);
        } catch (const OperationCancelledError&) {
            finish(record, TaskStatus::Cancelled, std::any(), std::current_exception());
        } catch (...) {
            finish(record, TaskStatus::Failed, std::any(), std::current_exception());
        }
    }

    void finish(const std::shared_ptr<TaskRecord>& record, TaskStatus status, std::any result, std::exception_ptr error) {
        std::vector<ProgressCallback> callbacks;
        TaskSnapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            record->status = status;
            record->endTime = Clock::now();
            // Финальное уведомление всегда с 1.0, независимо от исхода
            record->progress = 1.0;
            if (status == TaskStatus::Completed) {
                record->result = std::move(result);
                record->hasResult = true;
            } else {
                record->error = error;
            }
            callbacks = record->callbacks;
            snapshot = record->snapshot();
        }
        completionCv.notify_all();

        if (status == TaskStatus::Failed) {
            logger->error("Задача '{}' завершилась с ошибкой: {}", snapshot.id, TaskFailedError::describe(error));
        } else {
            logger->debug("Задача '{}' -> {}", snapshot.id, toString(status));
        }
        notify(callbacks, snapshot);
    }

    void notify(const std::vector<ProgressCallback>& callbacks, const TaskSnapshot& snapshot) {
        for (const auto& callback : callbacks) {
            try {
                callback(snapshot);
            } catch (const std::exception& e) {
                logger->error("Callback прогресса задачи '{}' бросил исключение: {}", snapshot.id, e.what());
            } catch (...) {
                logger->error("Callback прогресса задачи '{}' бросил неизвестное исключение", snapshot.id);
            }
        }
    }

    bool updateProgress(const TaskId& id, double fraction, const std::string& message) {
        std::vector<ProgressCallback> callbacks;
        TaskSnapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = tasks.find(id);
            if (it == tasks.end() || isTerminal(it->second->status)) {
                return false;
            }
            auto& record = *it->second;
            record.progress = std::max(0.0, std::min(1.0, fraction));
            record.message = message;
            callbacks = record.callbacks;
            snapshot = record.snapshot();
        }
        notify(callbacks, snapshot);
        return true;
    }

    TaskId submit(Work work, const SubmitOptions& options, std::shared_ptr<BatchGate> gate = nullptr) {
        auto record = createRecord(options);
        if (options.queueTimeout) {
            armQueueTimeout(record, *options.queueTimeout);
        }
        auto self = shared_from_this();
        auto job = [self, record, work = std::move(work), gate]() {
            self->execute(record, work);
            if (gate) self->releaseGate(gate);
        };

        if (gate) {
            bool launchNow = false;
            {
                std::lock_guard<std::mutex> lock(gate->mutex);
                if (gate->running < gate->limit) {
                    ++gate->running;
                    launchNow = true;
                } else {
                    gate->waiting.push_back(job);
                }
            }
            if (launchNow) enqueueOrCancel(record, job);
        } else {
            enqueueOrCancel(record, job);
        }
        logger->debug("Задача '{}' принята", record->id);
        return record->id;
    }

    void enqueueOrCancel(const std::shared_ptr<TaskRecord>& record, std::function<void()> job) {
        if (!pool->enqueue(std::move(job))) {
            cancelRecord(record);
        }
    }

    void releaseGate(const std::shared_ptr<BatchGate>& gate) {
        std::function<void()> next;
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->waiting.empty()) {
                --gate->running;
                return;
            }
            next = std::move(gate->waiting.front());
            gate->waiting.pop_front();
        }
        if (!pool->enqueue(next)) {
            // Пул остановлен: записи будут отменены shutdown
            std::lock_guard<std::mutex> lock(gate->mutex);
            gate->waiting.clear();
            gate->running = 0;
        }
    }

    bool cancelRecord(const std::shared_ptr<TaskRecord>& record) {
        std::vector<ProgressCallback> callbacks;
        TaskSnapshot snapshot;
        TimerQueue::TimerId queueTimer = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (record->status != TaskStatus::Pending) return false;
            record->status = TaskStatus::Cancelled;
            record->progress = 1.0;
            record->endTime = Clock::now();
            queueTimer = record->queueTimer;
            callbacks = record->callbacks;
            snapshot = record->snapshot();
        }
        if (queueTimer != 0) timers.cancel(queueTimer);
        completionCv.notify_all();
        notify(callbacks, snapshot);
        return true;
    }
};

TaskScheduler::TaskScheduler(const SchedulerConfig& config) {
    if (!config.validate()) {
        throw ConfigurationError("Некорректная конфигурация планировщика");
    }
    pImpl = std::make_shared<Impl>(config);
    pImpl->logger->info("TaskScheduler: создан, потоков={}", config.pool.threadCount);
}

TaskScheduler::~TaskScheduler() {
    shutdown();
}

TaskId TaskScheduler::submit(Work work, SubmitOptions options) {
    if (!work) {
        throw ConfigurationError("Пустая работа задачи");
    }
    return pImpl->submit(std::move(work), options);
}

TaskId TaskScheduler::submit(SimpleWork work, SubmitOptions options) {
    if (!work) {
        throw ConfigurationError("Пустая работа задачи");
    }
    return pImpl->submit([work = std::move(work)](TaskContext&) { return work(); }, options);
}

bool TaskScheduler::updateProgress(const TaskId& id, double fraction, const std::string& message) {
    return pImpl->updateProgress(id, fraction, message);
}

bool TaskScheduler::cancel(const TaskId& id) {
    std::shared_ptr<TaskRecord> record;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->tasks.find(id);
        if (it == pImpl->tasks.end()) return false;
        record = it->second;
        if (record->status == TaskStatus::Running) {
            record->token.cancel();
            pImpl->logger->debug("Задача '{}' выполняется, подан сигнал отмены", id);
            return false;
        }
    }
    bool cancelled = pImpl->cancelRecord(record);
    if (cancelled) {
        pImpl->logger->info("Задача '{}' отменена до старта", id);
    }
    return cancelled;
}

std::any TaskScheduler::await(const TaskId& id, std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->tasks.find(id);
    if (it == pImpl->tasks.end()) {
        throw TaskNotFoundError(id);
    }
    auto record = it->second;
    auto done = [&record] { return isTerminal(record->status); };
    if (timeout) {
        if (!pImpl->completionCv.wait_for(lock, *timeout, done)) {
            throw TaskTimeoutError(id, *timeout);
        }
    } else {
        pImpl->completionCv.wait(lock, done);
    }

    switch (record->status) {
        case TaskStatus::Completed:
            return record->result;
        case TaskStatus::Cancelled:
            throw TaskCancelledError(id);
        case TaskStatus::Failed:
            if (record->queueTimedOut) {
                std::rethrow_exception(record->error);
            }
            throw TaskFailedError(id, record->error);
        default:
            break;
    }
    throw IgnitionError("Непредвиденный статус задачи '" + id + "'");
}

void TaskScheduler::debounce(const std::string& key, SimpleWork work, std::chrono::milliseconds delay) {
    if (pImpl->shuttingDown) {
        return;
    }
    std::weak_ptr<Impl> weak = pImpl;
    auto fired = std::make_shared<TimerQueue::TimerId>(0);
    auto callback = [weak, key, work, fired]() {
        auto self = weak.lock();
        if (!self) return;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            auto it = self->debounceTimers.find(key);
            if (it != self->debounceTimers.end() && it->second == *fired) {
                self->debounceTimers.erase(it);
            }
        }
        if (self->shuttingDown) return;
        try {
            self->submit([work](TaskContext&) { return work(); }, SubmitOptions{});
        } catch (const SchedulerShutdownError&) {
            self->logger->debug("Debounce '{}': планировщик остановлен, вызов пропущен", key);
        }
    };

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->debounceTimers.find(key);
    if (it != pImpl->debounceTimers.end()) {
        pImpl->timers.cancel(it->second);
    }
    *fired = pImpl->timers.schedule(delay, callback);
    if (*fired != 0) {
        pImpl->debounceTimers[key] = *fired;
    }
}

std::vector<TaskId> TaskScheduler::batchSubmit(std::vector<SimpleWork> items, size_t maxConcurrent) {
    if (maxConcurrent == 0) {
        throw ConfigurationError("maxConcurrent должен быть больше 0");
    }
    auto gate = std::make_shared<BatchGate>();
    gate->limit = maxConcurrent;
    std::vector<TaskId> ids;
    ids.reserve(items.size());
    for (auto& item : items) {
        if (!item) {
            throw ConfigurationError("Пустая работа в пакете");
        }
        ids.push_back(pImpl->submit([work = std::move(item)](TaskContext&) { return work(); },
                                    SubmitOptions{}, gate));
    }
    pImpl->logger->debug("Пакет из {} задач, параллелизм {}", ids.size(), maxConcurrent);
    return ids;
}

bool TaskScheduler::addProgressCallback(const TaskId& id, ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->tasks.find(id);
    if (it == pImpl->tasks.end() || !callback) {
        return false;
    }
    it->second->callbacks.push_back(std::move(callback));
    return true;
}

size_t TaskScheduler::purgeCompleted(std::optional<std::chrono::milliseconds> retention) {
    auto window = retention ? *retention : pImpl->config.retention;
    auto now = Clock::now();
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (auto it = pImpl->tasks.begin(); it != pImpl->tasks.end();) {
        const auto& record = *it->second;
        if (isTerminal(record.status) && record.endTime && now - *record.endTime >= window) {
            it = pImpl->tasks.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        pImpl->logger->debug("Удалено {} завершённых задач", removed);
    }
    return removed;
}

std::optional<TaskSnapshot> TaskScheduler::getTask(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->tasks.find(id);
    if (it == pImpl->tasks.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

std::vector<TaskSnapshot> TaskScheduler::activeTasks() const {
    std::vector<TaskSnapshot> result;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& [id, record] : pImpl->tasks) {
        if (!isTerminal(record->status)) {
            result.push_back(record->snapshot());
        }
    }
    return result;
}

SchedulerMetrics TaskScheduler::getMetrics() const {
    SchedulerMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [id, record] : pImpl->tasks) {
            switch (record->status) {
                case TaskStatus::Pending: ++metrics.pending; break;
                case TaskStatus::Running: ++metrics.running; break;
                case TaskStatus::Completed: ++metrics.completed; break;
                case TaskStatus::Failed: ++metrics.failed; break;
                case TaskStatus::Cancelled: ++metrics.cancelled; break;
            }
        }
        metrics.totalSubmitted = pImpl->totalSubmitted;
        metrics.debounceTimers = pImpl->debounceTimers.size();
    }
    metrics.pool = pImpl->pool->getMetrics();
    return metrics;
}

size_t TaskScheduler::workerCount() const {
    return pImpl->config.pool.threadCount;
}

bool TaskScheduler::shutdown(std::optional<std::chrono::milliseconds> grace) {
    if (pImpl->shuttingDown.exchange(true)) {
        return true;
    }
    auto wait = grace ? *grace : pImpl->config.shutdownGrace;
    pImpl->logger->info("TaskScheduler: shutdown (grace {} ms)", wait.count());

    pImpl->timers.stop();
    std::vector<std::shared_ptr<TaskRecord>> pending;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->debounceTimers.clear();
        for (auto& [id, record] : pImpl->tasks) {
            if (record->status == TaskStatus::Pending) {
                pending.push_back(record);
            } else if (record->status == TaskStatus::Running) {
                record->token.cancel();
            }
        }
    }
    size_t cancelled = 0;
    for (const auto& record : pending) {
        if (pImpl->cancelRecord(record)) ++cancelled;
    }
    if (cancelled > 0) {
        pImpl->logger->info("TaskScheduler: отменено {} ожидающих задач", cancelled);
    }

    bool clean = pImpl->pool->stop(wait);
    pImpl->completionCv.notify_all();
    if (!clean) {
        pImpl->logger->warn("TaskScheduler: часть задач не завершилась за {} ms", wait.count());
    }
    return clean;
}

bool TaskScheduler::isShutdown() const {
    return pImpl->shuttingDown;
}

} // namespace scheduler
} // namespace ignition
