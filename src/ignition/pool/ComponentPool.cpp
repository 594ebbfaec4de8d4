#include "ignition/pool/ComponentPool.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <unordered_map>
#include <deque>
#include <algorithm>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>

namespace ignition {
namespace pool {

namespace {

using Clock = std::chrono::steady_clock;

struct PooledComponent {
    Instance instance;
    Clock::time_point createdAt = Clock::now();
    Clock::time_point lastUsed = Clock::now();
    size_t useCount = 0;
    bool inUse = false;
};

struct KindPool {
    PoolSettings settings;
    std::deque<std::shared_ptr<PooledComponent>> available;
    std::unordered_map<void*, std::shared_ptr<PooledComponent>> inUse;
    size_t created = 0;
    size_t recycled = 0;
    size_t peakUsage = 0;

    PoolStats stats() const {
        PoolStats s;
        s.created = created;
        s.recycled = recycled;
        s.available = available.size();
        s.inUse = inUse.size();
        s.peakUsage = peakUsage;
        s.recycleRatio = static_cast<double>(recycled) / static_cast<double>(std::max<size_t>(created, 1));
        return s;
    }
};

// Экземпляр к уничтожению вне блокировки
struct Doomed {
    std::string kind;
    InstanceHook cleanup;
    std::shared_ptr<PooledComponent> component;
};

} // namespace

struct ComponentPool::Impl {
    Options options;
    std::unordered_map<std::string, KindPool> pools;
    mutable std::timed_mutex mutex;
    std::thread sweepThread;
    std::mutex sweepMutex;
    std::condition_variable sweepCv;
    std::atomic<bool> stopSweep{false};
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("pool");

    explicit Impl(const Options& opts) : options(opts) {}

    void destroy(std::vector<Doomed>& doomed) {
        for (auto& item : doomed) {
            if (!item.cleanup) continue;
            try {
                item.cleanup(item.component->instance);
            } catch (const std::exception& e) {
                logger->error("Pool '{}': cleanup бросил исключение: {}", item.kind, e.what());
            } catch (...) {
                logger->error("Pool '{}': cleanup бросил неизвестное исключение", item.kind);
            }
        }
        doomed.clear();
    }

    // Вызывается под mutex
    void collectExpired(KindPool& pool, Clock::time_point now, std::vector<Doomed>& doomed) {
        for (auto it = pool.available.begin(); it != pool.available.end();) {
            if (now - (*it)->lastUsed > pool.settings.ttl) {
                doomed.push_back({pool.settings.kind, pool.settings.cleanup, *it});
                it = pool.available.erase(it);
            } else {
                ++it;
            }
        }
    }

    void sweepLoop() {
        while (!stopSweep) {
            {
                std::unique_lock<std::mutex> lock(sweepMutex);
                sweepCv.wait_for(lock, options.sweepInterval, [this] { return stopSweep.load(); });
            }
            if (stopSweep) break;
            sweep();
        }
    }

    size_t sweep() {
        std::vector<Doomed> doomed;
        {
            std::lock_guard<std::timed_mutex> lock(mutex);
            auto now = Clock::now();
            for (auto& [kind, pool] : pools) {
                collectExpired(pool, now, doomed);
            }
        }
        size_t count = doomed.size();
        destroy(doomed);
        if (count > 0) {
            logger->debug("Pool: вытеснено {} простаивающих экземпляров", count);
        }
        return count;
    }

    void stopSweepThread() {
        {
            std::lock_guard<std::mutex> lock(sweepMutex);
            stopSweep = true;
        }
        sweepCv.notify_all();
        if (sweepThread.joinable()) sweepThread.join();
    }
};

ComponentPool::ComponentPool() : ComponentPool(Options{}) {}

ComponentPool::ComponentPool(const Options& options) : pImpl(std::make_unique<Impl>(options)) {
    if (options.sweepInterval.count() > 0) {
        pImpl->sweepThread = std::thread([this]() { pImpl->sweepLoop(); });
    }
    pImpl->logger->debug("ComponentPool: создан, sweepInterval={} ms", options.sweepInterval.count());
}

ComponentPool::~ComponentPool() {
    shutdown();
}

void ComponentPool::registerPool(PoolSettings settings) {
    if (!settings.validate()) {
        throw ConfigurationError("Некорректные параметры пула '" + settings.kind + "'");
    }
    std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
    if (pImpl->pools.count(settings.kind) > 0) {
        throw DuplicateRegistrationError(settings.kind);
    }
    std::string kind = settings.kind;
    KindPool pool;
    pool.settings = std::move(settings);
    pImpl->pools.emplace(kind, std::move(pool));
    pImpl->logger->info("Pool: зарегистрирован вид '{}' (maxSize={}, ttl={} ms)", kind,
                        pImpl->pools.at(kind).settings.maxSize, pImpl->pools.at(kind).settings.ttl.count());
}

bool ComponentPool::hasPool(const std::string& kind) const {
    std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
    return pImpl->pools.count(kind) > 0;
}

Instance ComponentPool::acquire(const std::string& kind) {
    InstanceFactory factory;
    InstanceHook reset;
    InstanceHook cleanup;
    while (true) {
        std::vector<Doomed> doomed;
        std::shared_ptr<PooledComponent> candidate;
        {
            std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
            auto it = pImpl->pools.find(kind);
            if (it == pImpl->pools.end()) {
                pImpl->logger->warn("Pool: неизвестный вид '{}'", kind);
                return nullptr;
            }
            auto& pool = it->second;
            factory = pool.settings.factory;
            reset = pool.settings.reset;
            cleanup = pool.settings.cleanup;
            auto now = Clock::now();
            while (!pool.available.empty()) {
                auto front = pool.available.front();
                pool.available.pop_front();
                if (now - front->lastUsed > pool.settings.ttl) {
                    doomed.push_back({kind, cleanup, front});
                    continue;
                }
                // Помечаем выданным до reset, чтобы другой поток его не взял
                front->inUse = true;
                pool.inUse[front->instance.get()] = front;
                candidate = front;
                break;
            }
        }
        pImpl->destroy(doomed);

        if (!candidate) break;

        std::optional<std::string> resetFailure;
        try {
            if (reset) reset(candidate->instance);
        } catch (const std::exception& e) {
            resetFailure = e.what();
        } catch (...) {
            resetFailure = "неизвестное исключение";
        }
        if (resetFailure) {
            PoolResetError error(kind, *resetFailure);
            pImpl->logger->warn("Pool: {}; экземпляр уничтожен, пробуем следующий", error.what());
            {
                std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
                auto it = pImpl->pools.find(kind);
                if (it != pImpl->pools.end()) it->second.inUse.erase(candidate->instance.get());
            }
            std::vector<Doomed> failed{{kind, cleanup, candidate}};
            pImpl->destroy(failed);
            continue;
        }

        std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
        auto& pool = pImpl->pools.at(kind);
        candidate->lastUsed = Clock::now();
        ++candidate->useCount;
        ++pool.recycled;
        pool.peakUsage = std::max(pool.peakUsage, pool.inUse.size());
        pImpl->logger->debug("Pool: '{}' выдан повторно (использований {})", kind, candidate->useCount);
        return candidate->instance;
    }

    Instance instance;
    try {
        instance = factory();
    } catch (const std::exception& e) {
        pImpl->logger->error("Pool: фабрика '{}' бросила исключение: {}", kind, e.what());
        return nullptr;
    }
    if (!instance) {
        pImpl->logger->error("Pool: фабрика '{}' вернула пустой экземпляр", kind);
        return nullptr;
    }

    auto component = std::make_shared<PooledComponent>();
    component->instance = instance;
    component->inUse = true;
    component->useCount = 1;

    std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
    auto it = pImpl->pools.find(kind);
    if (it == pImpl->pools.end()) {
        return instance;
    }
    auto& pool = it->second;
    pool.inUse[instance.get()] = component;
    ++pool.created;
    pool.peakUsage = std::max(pool.peakUsage, pool.inUse.size());
    pImpl->logger->debug("Pool: создан новый '{}' (всего {})", kind, pool.created);
    return instance;
}

bool ComponentPool::release(const std::string& kind, const Instance& instance) {
    if (!instance) return false;
    std::vector<Doomed> doomed;
    {
        std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
        auto it = pImpl->pools.find(kind);
        if (it == pImpl->pools.end()) {
            pImpl->logger->warn("Pool: release в неизвестный вид '{}'", kind);
            return false;
        }
        auto& pool = it->second;
        auto used = pool.inUse.find(instance.get());
        if (used == pool.inUse.end()) {
            pImpl->logger->warn("Pool: release экземпляра, не выданного пулом '{}'", kind);
            return false;
        }
        auto component = used->second;
        pool.inUse.erase(used);
        component->inUse = false;
        component->lastUsed = Clock::now();
        if (pool.available.size() >= pool.settings.maxSize) {
            doomed.push_back({kind, pool.settings.cleanup, pool.available.front()});
            pool.available.pop_front();
        }
        pool.available.push_back(component);
    }
    if (!doomed.empty()) {
        pImpl->logger->debug("Pool: '{}' переполнен, вытеснен самый старый", kind);
    }
    pImpl->destroy(doomed);
    return true;
}

size_t ComponentPool::forceCleanup(const std::optional<std::string>& kind,
                                   std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::timed_mutex> lock(pImpl->mutex, std::defer_lock);
    if (timeout) {
        if (!lock.try_lock_for(*timeout)) {
            throw PoolTimeoutError(*timeout);
        }
    } else {
        lock.lock();
    }

    std::vector<Doomed> doomed;
    for (auto& [name, pool] : pImpl->pools) {
        if (kind && name != *kind) continue;
        for (auto& component : pool.available) {
            doomed.push_back({name, pool.settings.cleanup, component});
        }
        pool.available.clear();
    }
    lock.unlock();

    size_t count = doomed.size();
    pImpl->destroy(doomed);
    pImpl->logger->info("Pool: принудительно уничтожено {} экземпляров{}", count,
                        kind ? " вида '" + *kind + "'" : std::string());
    return count;
}

size_t ComponentPool::sweepExpired() {
    return pImpl->sweep();
}

std::map<std::string, PoolStats> ComponentPool::getStats() const {
    std::map<std::string, PoolStats> result;
    std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
    for (const auto& [kind, pool] : pImpl->pools) {
        result.emplace(kind, pool.stats());
    }
    return result;
}

std::optional<PoolStats> ComponentPool::getStats(const std::string& kind) const {
    std::lock_guard<std::timed_mutex> lock(pImpl->mutex);
    auto it = pImpl->pools.find(kind);
    if (it == pImpl->pools.end()) return std::nullopt;
    return it->second.stats();
}

nlohmann::json ComponentPool::statsToJson() const {
    nlohmann::json pools = nlohmann::json::object();
    size_t totalCreated = 0;
    size_t totalRecycled = 0;
    for (const auto& [kind, stats] : getStats()) {
        pools[kind] = stats.toJson();
        totalCreated += stats.created;
        totalRecycled += stats.recycled;
    }
    return {
        {"pools", pools},
        {"totalCreated", totalCreated},
        {"totalRecycled", totalRecycled}
    };
}

void ComponentPool::shutdown() {
    if (pImpl->stopSweep && !pImpl->sweepThread.joinable()) {
        return;
    }
    pImpl->stopSweepThread();
    size_t count = forceCleanup();
    pImpl->logger->info("ComponentPool: shutdown, освобождено {} экземпляров", count);
}

} // namespace pool
} // namespace ignition
