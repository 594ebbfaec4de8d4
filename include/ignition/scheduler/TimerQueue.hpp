#pragma once

#include <functional>
#include <memory>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace ignition {
namespace scheduler {

// TimerQueue: один фоновый поток, исполняющий отложенные callbacks по дедлайнам.
// Callbacks выполняются на потоке таймера вне внутренней блокировки
class TimerQueue {
public:
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    TimerQueue(); // Конструктор
    ~TimerQueue(); // Деструктор
    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback callback); // Запланировать (0 после stop)
    bool cancel(TimerId id); // Отменить, если ещё не сработал
    size_t pending() const; // Кол-во ожидающих таймеров
    void stop(); // Остановить поток, отбросив ожидающие таймеры
private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Реализация, разделяется с потоком таймера
};

} // namespace scheduler
} // namespace ignition
