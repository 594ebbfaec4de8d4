#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <exception>
#include <chrono>

namespace ignition {

// IgnitionError: базовое исключение библиотеки
class IgnitionError : public std::runtime_error {
public:
    explicit IgnitionError(const std::string& message) : std::runtime_error(message) {}
};

// Ошибки конфигурации (некорректные параметры, tier-зависимости и т.п.)
class ConfigurationError : public IgnitionError {
public:
    explicit ConfigurationError(const std::string& message) : IgnitionError(message) {}
};

// Повторная регистрация имени
class DuplicateRegistrationError : public IgnitionError {
public:
    explicit DuplicateRegistrationError(const std::string& name)
        : IgnitionError("Имя уже зарегистрировано: '" + name + "'"), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

// Зависимость ссылается на незарегистрированное имя
class UnknownDependencyError : public IgnitionError {
public:
    UnknownDependencyError(const std::string& owner, const std::string& dependency)
        : IgnitionError("'" + owner + "' зависит от незарегистрированного '" + dependency + "'"),
          owner_(owner), dependency_(dependency) {}
    const std::string& owner() const { return owner_; }
    const std::string& dependency() const { return dependency_; }
private:
    std::string owner_;
    std::string dependency_;
};

// DependencyCycleError: цикл в графе зависимостей, path замкнут (a -> b -> a)
class DependencyCycleError : public IgnitionError {
public:
    explicit DependencyCycleError(std::vector<std::string> path)
        : IgnitionError("Обнаружен цикл зависимостей: " + format(path)), path_(std::move(path)) {}
    const std::vector<std::string>& cycle() const { return path_; }
private:
    static std::string format(const std::vector<std::string>& path) {
        std::string out;
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) out += " -> ";
            out += path[i];
        }
        return out;
    }
    std::vector<std::string> path_;
};

// Истечение времени ожидания (базовый класс)
class TimeoutError : public IgnitionError {
public:
    explicit TimeoutError(const std::string& message) : IgnitionError(message) {}
};

// Задача не завершилась / не стартовала за отведённое время
class TaskTimeoutError : public TimeoutError {
public:
    TaskTimeoutError(const std::string& taskId, std::chrono::milliseconds timeout)
        : TimeoutError("Таймаут задачи '" + taskId + "' (" + std::to_string(timeout.count()) + " ms)"),
          taskId_(taskId), timeout_(timeout) {}
    const std::string& taskId() const { return taskId_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
private:
    std::string taskId_;
    std::chrono::milliseconds timeout_;
};

// Не удалось захватить пул за отведённое время
class PoolTimeoutError : public TimeoutError {
public:
    explicit PoolTimeoutError(std::chrono::milliseconds timeout)
        : TimeoutError("Таймаут ожидания пула компонентов (" + std::to_string(timeout.count()) + " ms)") {}
};

// TaskFailedError: оборачивает исключение, выброшенное работой задачи
class TaskFailedError : public IgnitionError {
public:
    TaskFailedError(const std::string& taskId, std::exception_ptr cause)
        : IgnitionError("Задача '" + taskId + "' завершилась с ошибкой: " + describe(cause)),
          taskId_(taskId), cause_(std::move(cause)) {}
    const std::string& taskId() const { return taskId_; }
    std::exception_ptr cause() const { return cause_; }
    void rethrowCause() const {
        if (cause_) std::rethrow_exception(cause_);
    }
    static std::string describe(const std::exception_ptr& ep) {
        if (!ep) return "неизвестная ошибка";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "нестандартное исключение";
        }
    }
private:
    std::string taskId_;
    std::exception_ptr cause_;
};

// Задача была отменена до/во время выполнения
class TaskCancelledError : public IgnitionError {
public:
    explicit TaskCancelledError(const std::string& taskId)
        : IgnitionError("Задача '" + taskId + "' отменена"), taskId_(taskId) {}
    const std::string& taskId() const { return taskId_; }
private:
    std::string taskId_;
};

// Бросается кооперативной работой, заметившей сигнал отмены
class OperationCancelledError : public IgnitionError {
public:
    OperationCancelledError() : IgnitionError("Операция отменена") {}
};

class TaskNotFoundError : public IgnitionError {
public:
    explicit TaskNotFoundError(const std::string& taskId)
        : IgnitionError("Задача не найдена: '" + taskId + "'") {}
};

// Планировщик остановлен, новые задачи не принимаются
class SchedulerShutdownError : public IgnitionError {
public:
    SchedulerShutdownError() : IgnitionError("Планировщик завершает работу") {}
};

// Внутренняя ошибка reset-хука пула, наружу не выходит
class PoolResetError : public IgnitionError {
public:
    PoolResetError(const std::string& kind, const std::string& reason)
        : IgnitionError("Сброс экземпляра '" + kind + "' не удался: " + reason) {}
};

// Внутренняя ошибка ввода-вывода дискового кэша, трактуется как промах
class CacheIOError : public IgnitionError {
public:
    explicit CacheIOError(const std::string& message) : IgnitionError(message) {}
};

} // namespace ignition
