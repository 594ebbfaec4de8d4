#include "ignition/scheduler/TimerQueue.hpp"
#include "ignition/common/Logging.hpp"
#include <map>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>

namespace ignition {
namespace scheduler {

struct TimerQueue::Impl {
    struct Timer {
        Clock::time_point deadline;
        Callback callback;
    };
    std::map<TimerId, Timer> timers;
    std::multimap<Clock::time_point, TimerId> deadlines;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::thread worker;
    std::atomic<bool> stopFlag{false};
    TimerId nextId = 1;
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("scheduler");

    void eraseDeadline(TimerId id, Clock::time_point deadline) {
        auto range = deadlines.equal_range(deadline);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == id) {
                deadlines.erase(it);
                return;
            }
        }
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopFlag) {
            if (deadlines.empty()) {
                cv.wait(lock, [this] { return stopFlag || !deadlines.empty(); });
                continue;
            }
            auto next = deadlines.begin();
            if (Clock::now() < next->first) {
                cv.wait_until(lock, next->first);
                continue;
            }
            TimerId id = next->second;
            deadlines.erase(next);
            auto it = timers.find(id);
            if (it == timers.end()) continue;
            Callback callback = std::move(it->second.callback);
            timers.erase(it);

            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                logger->error("TimerQueue: исключение в callback таймера #{}: {}", id, e.what());
            }
            lock.lock();
        }
    }
};

TimerQueue::TimerQueue() : pImpl(std::make_shared<Impl>()) {
    auto impl = pImpl;
    pImpl->worker = std::thread([impl]() { impl->run(); });
}

TimerQueue::~TimerQueue() {
    stop();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback callback) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopFlag) {
            return 0;
        }
        id = pImpl->nextId++;
        auto deadline = Clock::now() + delay;
        pImpl->timers.emplace(id, Impl::Timer{deadline, std::move(callback)});
        pImpl->deadlines.emplace(deadline, id);
    }
    pImpl->cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->timers.find(id);
    if (it == pImpl->timers.end()) {
        return false;
    }
    pImpl->eraseDeadline(id, it->second.deadline);
    pImpl->timers.erase(it);
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->timers.size();
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stopFlag = true;
        pImpl->timers.clear();
        pImpl->deadlines.clear();
    }
    pImpl->cv.notify_all();
    if (pImpl->worker.joinable()) {
        if (pImpl->worker.get_id() == std::this_thread::get_id()) {
            // stop() вызван из callback таймера
            pImpl->worker.detach();
        } else {
            pImpl->worker.join();
        }
    }
}

} // namespace scheduler
} // namespace ignition
