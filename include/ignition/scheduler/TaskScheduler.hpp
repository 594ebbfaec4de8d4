#pragma once

#include <any>
#include <memory>
#include <vector>
#include <optional>
#include <functional>
#include "ignition/scheduler/TaskTypes.hpp"

namespace ignition {
namespace scheduler {

// TaskScheduler: исполнение именованных задач на пуле фиксированного размера.
// Отслеживает статус и прогресс, поддерживает отмену, debounce и пакетную
// отправку с ограничением параллелизма. Ошибки работы сохраняются и
// пробрасываются каждому ожидающему в виде TaskFailedError
class TaskScheduler {
public:
    using Work = std::function<std::any(TaskContext&)>;
    using SimpleWork = std::function<std::any()>;

    explicit TaskScheduler(const SchedulerConfig& config = SchedulerConfig{}); // Конструктор
    ~TaskScheduler(); // Деструктор (shutdown)
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Отправить задачу. Бросает DuplicateRegistrationError для живого имени,
    // SchedulerShutdownError после shutdown
    TaskId submit(Work work, SubmitOptions options = SubmitOptions{});
    TaskId submit(SimpleWork work, SubmitOptions options = SubmitOptions{});

    bool updateProgress(const TaskId& id, double fraction, const std::string& message = ""); // Обновить прогресс
    // Pending -> Cancelled (true). Для Running подаёт сигнал токену и возвращает false
    bool cancel(const TaskId& id);
    // Дождаться результата. TaskTimeoutError / TaskFailedError / TaskCancelledError / TaskNotFoundError
    std::any await(const TaskId& id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    template<typename T>
    T awaitAs(const TaskId& id, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return std::any_cast<T>(await(id, timeout));
    }

    // Перезапускает таймер ключа; выполняется только последний вызов
    void debounce(const std::string& key, SimpleWork work, std::chrono::milliseconds delay);
    // Пакет задач, одновременно выполняется не более maxConcurrent
    std::vector<TaskId> batchSubmit(std::vector<SimpleWork> items, size_t maxConcurrent);

    bool addProgressCallback(const TaskId& id, ProgressCallback callback); // Добавить callback
    size_t purgeCompleted(std::optional<std::chrono::milliseconds> retention = std::nullopt); // Удалить старые записи
    std::optional<TaskSnapshot> getTask(const TaskId& id) const; // Снимок задачи
    std::vector<TaskSnapshot> activeTasks() const; // Pending + Running
    SchedulerMetrics getMetrics() const; // Метрики
    size_t workerCount() const; // Размер пула

    // Остановить: новые задачи отклоняются, ожидающие отменяются,
    // выполняющимся подаётся сигнал. false, если часть работы оставлена
    bool shutdown(std::optional<std::chrono::milliseconds> grace = std::nullopt);
    bool isShutdown() const;

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Реализация
};

} // namespace scheduler
} // namespace ignition
