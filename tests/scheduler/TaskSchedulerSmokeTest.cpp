#include <cassert>
#include <iostream>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <string>
#include "ignition/scheduler/TaskScheduler.hpp"
#include "ignition/common/Errors.hpp"

using namespace ignition;
using namespace ignition::scheduler;

namespace {

SchedulerConfig makeConfig(size_t threads) {
    SchedulerConfig config;
    config.pool.threadCount = threads;
    config.shutdownGrace = std::chrono::milliseconds(1000);
    return config;
}

} // namespace

void testSubmitAndAwait() {
    std::cout << "Testing TaskScheduler submit/await...\n";

    TaskScheduler scheduler(makeConfig(2));
    auto id = scheduler.submit([]() -> std::any { return 21 * 2; });
    assert(scheduler.awaitAs<int>(id) == 42);

    auto snapshot = scheduler.getTask(id);
    assert(snapshot);
    assert(snapshot->status == TaskStatus::Completed);
    assert(snapshot->progress == 1.0);
    assert(snapshot->hasResult);
    assert(snapshot->duration().has_value());
    assert(snapshot->toJson()["status"] == "completed");

    // Повторное ожидание возвращает тот же результат
    assert(scheduler.awaitAs<int>(id) == 42);

    std::cout << "[OK] TaskScheduler submit/await test\n";
}

void testTaskFailure() {
    std::cout << "Testing TaskScheduler failure propagation...\n";

    TaskScheduler scheduler(makeConfig(1));
    auto id = scheduler.submit([]() -> std::any { throw std::runtime_error("loader exploded"); });
    bool thrown = false;
    try {
        scheduler.await(id);
    } catch (const TaskFailedError& e) {
        thrown = true;
        assert(e.taskId() == id);
        assert(TaskFailedError::describe(e.cause()) == "loader exploded");
    }
    assert(thrown);
    assert(scheduler.getTask(id)->status == TaskStatus::Failed);

    bool notFound = false;
    try {
        scheduler.await("missing");
    } catch (const TaskNotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    std::cout << "[OK] TaskScheduler failure test\n";
}

void testProgressReporting() {
    std::cout << "Testing TaskScheduler progress...\n";

    TaskScheduler scheduler(makeConfig(1));
    std::mutex mutex;
    std::vector<double> seen;
    SubmitOptions options;
    options.name = "progress-task";
    options.onProgress = [&](const TaskSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(snapshot.progress);
    };
    auto id = scheduler.submit([](TaskContext& context) -> std::any {
        context.reportProgress(0.25, "quarter");
        context.reportProgress(0.5);
        context.reportProgress(7.0);
        return std::string("done");
    }, options);
    assert(id == "progress-task");
    assert(scheduler.awaitAs<std::string>(id) == "done");

    std::lock_guard<std::mutex> lock(mutex);
    assert(seen.size() == 4);
    assert(seen[0] == 0.25);
    assert(seen[1] == 0.5);
    assert(seen[2] == 1.0);
    assert(seen[3] == 1.0);
    // Обновления после завершения отвергаются
    assert(!scheduler.updateProgress(id, 0.1));

    std::cout << "[OK] TaskScheduler progress test\n";
}

void testDuplicateName() {
    std::cout << "Testing TaskScheduler duplicate names...\n";

    TaskScheduler scheduler(makeConfig(1));
    std::atomic<bool> release{false};
    SubmitOptions options;
    options.name = "unique";
    auto id = scheduler.submit([&]() -> std::any {
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return std::any();
    }, options);

    bool duplicate = false;
    try {
        scheduler.submit([]() -> std::any { return std::any(); }, options);
    } catch (const DuplicateRegistrationError&) {
        duplicate = true;
    }
    assert(duplicate);
    release = true;
    scheduler.await(id);

    // После завершения имя снова свободно
    auto again = scheduler.submit([]() -> std::any { return 1; }, options);
    assert(again == "unique");
    scheduler.await(again);

    std::cout << "[OK] TaskScheduler duplicate name test\n";
}

void testCancelPendingAndRunning() {
    std::cout << "Testing TaskScheduler cancel...\n";

    TaskScheduler scheduler(makeConfig(1));
    std::atomic<bool> started{false};
    auto running = scheduler.submit([&](TaskContext& context) -> std::any {
        started = true;
        while (!context.isCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        context.throwIfCancelled();
        return std::any();
    });
    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    std::atomic<bool> ran{false};
    auto pending = scheduler.submit([&]() -> std::any { ran = true; return std::any(); });

    assert(scheduler.cancel(pending));
    assert(scheduler.getTask(pending)->status == TaskStatus::Cancelled);

    // Выполняющаяся задача получает сигнал, но cancel возвращает false
    assert(!scheduler.cancel(running));
    bool cancelled = false;
    try {
        scheduler.await(running, std::chrono::milliseconds(1000));
    } catch (const TaskCancelledError&) {
        cancelled = true;
    }
    assert(cancelled);

    bool pendingCancelled = false;
    try {
        scheduler.await(pending);
    } catch (const TaskCancelledError&) {
        pendingCancelled = true;
    }
    assert(pendingCancelled);
    assert(!ran);
    assert(!scheduler.cancel("missing"));

    std::cout << "[OK] TaskScheduler cancel test\n";
}

void testAwaitTimeout() {
    std::cout << "Testing TaskScheduler await timeout...\n";

    TaskScheduler scheduler(makeConfig(1));
    auto id = scheduler.submit([]() -> std::any {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return 7;
    });
    bool timedOut = false;
    try {
        scheduler.await(id, std::chrono::milliseconds(10));
    } catch (const TaskTimeoutError&) {
        timedOut = true;
    }
    assert(timedOut);
    // Таймаут ожидания не отменяет задачу
    assert(scheduler.awaitAs<int>(id, std::chrono::milliseconds(2000)) == 7);

    std::cout << "[OK] TaskScheduler await timeout test\n";
}

void testQueueTimeout() {
    std::cout << "Testing TaskScheduler submission timeout...\n";

    TaskScheduler scheduler(makeConfig(1));
    auto blocker = scheduler.submit([]() -> std::any {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return std::any();
    });
    std::atomic<bool> ran{false};
    SubmitOptions options;
    options.queueTimeout = std::chrono::milliseconds(20);
    auto starving = scheduler.submit([&]() -> std::any { ran = true; return std::any(); }, options);

    bool timedOut = false;
    try {
        scheduler.await(starving);
    } catch (const TaskTimeoutError&) {
        timedOut = true;
    }
    assert(timedOut);
    assert(scheduler.getTask(starving)->status == TaskStatus::Failed);
    scheduler.await(blocker);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(!ran);

    std::cout << "[OK] TaskScheduler submission timeout test\n";
}

void testDebounceCoalescing() {
    std::cout << "Testing TaskScheduler debounce...\n";

    TaskScheduler scheduler(makeConfig(2));
    std::atomic<int> calls{0};
    std::atomic<int> lastValue{0};
    for (int i = 1; i <= 5; ++i) {
        scheduler.debounce("search", [&, i]() -> std::any {
            calls++;
            lastValue = i;
            return std::any();
        }, std::chrono::milliseconds(40));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(scheduler.getMetrics().debounceTimers == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    assert(calls == 1);
    assert(lastValue == 5);
    assert(scheduler.getMetrics().debounceTimers == 0);

    std::cout << "[OK] TaskScheduler debounce test\n";
}

void testBatchConcurrencyBound() {
    std::cout << "Testing TaskScheduler batch bound...\n";

    TaskScheduler scheduler(makeConfig(4));
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<TaskScheduler::SimpleWork> items;
    for (int i = 0; i < 8; ++i) {
        items.push_back([&, i]() -> std::any {
            int now = ++running;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(15));
            --running;
            return i;
        });
    }
    auto ids = scheduler.batchSubmit(std::move(items), 2);
    assert(ids.size() == 8);
    for (size_t i = 0; i < ids.size(); ++i) {
        assert(scheduler.awaitAs<int>(ids[i], std::chrono::milliseconds(5000)) == static_cast<int>(i));
    }
    assert(peak <= 2);

    bool rejected = false;
    try {
        scheduler.batchSubmit({}, 0);
    } catch (const ConfigurationError&) {
        rejected = true;
    }
    assert(rejected);

    std::cout << "[OK] TaskScheduler batch test\n";
}

void testPurgeAndMetrics() {
    std::cout << "Testing TaskScheduler purge/metrics...\n";

    TaskScheduler scheduler(makeConfig(2));
    std::vector<TaskId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(scheduler.submit([i]() -> std::any { return i; }));
    }
    auto failing = scheduler.submit([]() -> std::any { throw std::runtime_error("x"); });
    for (const auto& id : ids) scheduler.await(id);
    bool failed = false;
    try {
        scheduler.await(failing);
    } catch (const TaskFailedError&) {
        failed = true;
    }
    assert(failed);

    auto metrics = scheduler.getMetrics();
    assert(metrics.completed == 4);
    assert(metrics.failed == 1);
    assert(metrics.totalSubmitted == 5);
    assert(metrics.pool.totalThreads == 2);
    assert(scheduler.activeTasks().empty());

    // Окно хранения ещё не прошло
    assert(scheduler.purgeCompleted(std::chrono::hours(1)) == 0);
    assert(scheduler.purgeCompleted(std::chrono::milliseconds(0)) == 5);
    assert(!scheduler.getTask(ids[0]));
    assert(scheduler.getMetrics().total() == 0);

    std::cout << "[OK] TaskScheduler purge test\n";
}

void testShutdownRejectsSubmissions() {
    std::cout << "Testing TaskScheduler shutdown...\n";

    TaskScheduler scheduler(makeConfig(1));
    std::atomic<bool> started{false};
    auto running = scheduler.submit([&](TaskContext& context) -> std::any {
        started = true;
        while (!context.isCancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return std::string("stopped");
    });
    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    auto pending = scheduler.submit([]() -> std::any { return 1; });

    assert(scheduler.shutdown(std::chrono::milliseconds(1000)));
    assert(scheduler.isShutdown());
    assert(scheduler.getTask(pending)->status == TaskStatus::Cancelled);
    assert(scheduler.awaitAs<std::string>(running) == "stopped");

    bool rejected = false;
    try {
        scheduler.submit([]() -> std::any { return 1; });
    } catch (const SchedulerShutdownError&) {
        rejected = true;
    }
    assert(rejected);
    // Повторный shutdown безопасен
    assert(scheduler.shutdown());

    std::cout << "[OK] TaskScheduler shutdown test\n";
}

void testTerminalProgressAndThrowingCallbacks() {
    std::cout << "Testing TaskScheduler terminal progress...\n";

    TaskScheduler scheduler(makeConfig(1));
    std::mutex mutex;
    std::vector<TaskSnapshot> seen;
    SubmitOptions options;
    options.onProgress = [&](const TaskSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(snapshot);
    };
    auto failing = scheduler.submit([](TaskContext& context) -> std::any {
        context.reportProgress(0.3, "parsing");
        throw std::runtime_error("bad asset");
    }, options);
    bool failed = false;
    try {
        scheduler.await(failing);
    } catch (const TaskFailedError&) {
        failed = true;
    }
    assert(failed);
    // Финальный callback вызывается после пробуждения ожидающих
    for (int i = 0; i < 200; ++i) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (seen.size() == 2) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(seen.size() == 2);
        assert(seen[0].progress == 0.3);
        assert(seen[1].status == TaskStatus::Failed);
        assert(seen[1].progress == 1.0);
    }
    assert(scheduler.getTask(failing)->progress == 1.0);

    // Отменённая до старта задача тоже завершается с 1.0
    std::atomic<bool> release{false};
    auto blocker = scheduler.submit([&]() -> std::any {
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return std::any();
    });
    auto pending = scheduler.submit([]() -> std::any { return 1; });
    assert(scheduler.cancel(pending));
    assert(scheduler.getTask(pending)->progress == 1.0);
    release = true;
    scheduler.await(blocker);

    // Callback, бросающий не std::exception, не меняет исход задачи
    SubmitOptions throwing;
    throwing.onProgress = [](const TaskSnapshot&) { throw 42; };
    auto id = scheduler.submit([](TaskContext& context) -> std::any {
        context.reportProgress(0.5);
        return 7;
    }, throwing);
    assert(scheduler.awaitAs<int>(id) == 7);
    assert(scheduler.getTask(id)->status == TaskStatus::Completed);

    std::cout << "[OK] TaskScheduler terminal progress test\n";
}

int main() {
    try {
        testSubmitAndAwait();
        testTaskFailure();
        testProgressReporting();
        testDuplicateName();
        testCancelPendingAndRunning();
        testAwaitTimeout();
        testQueueTimeout();
        testDebounceCoalescing();
        testBatchConcurrencyBound();
        testPurgeAndMetrics();
        testShutdownRejectsSubmissions();
        testTerminalProgressAndThrowingCallbacks();
        std::cout << "All TaskScheduler tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "TaskScheduler test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
