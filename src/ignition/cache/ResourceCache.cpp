#include "ignition/cache/ResourceCache.hpp"
#include "ignition/cache/CacheEntry.hpp"
#include "ignition/cache/FileBackingStore.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <fnmatch.h>
#include <unordered_map>
#include <set>
#include <vector>
#include <algorithm>
#include <mutex>
#include <future>
#include <thread>
#include <condition_variable>
#include <atomic>

namespace ignition {
namespace cache {

struct ResourceCache::Impl {
    CacheConfig config;
    std::shared_ptr<BackingStore> store;
    std::unordered_map<std::string, CacheEntry> memory;
    std::unordered_map<std::string, std::shared_future<nlohmann::json>> inflight;
    mutable std::mutex mutex;
    std::mutex inflightMutex;
    std::atomic<size_t> hits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> evictions{0};
    std::atomic<size_t> computeCount{0};
    std::thread cleanupThread;
    std::mutex cleanupMutex;
    std::condition_variable cleanupCv;
    std::atomic<bool> stopCleanup{false};
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("cache");

    Impl(const CacheConfig& cfg, std::shared_ptr<BackingStore> backing)
        : config(cfg), store(std::move(backing)) {}

    // --- второй уровень: любые ошибки логируются и считаются промахом ---

    std::optional<CacheEntry> diskGet(const std::string& key) {
        if (!store) return std::nullopt;
        auto hashed = hashKey(key);
        try {
            auto bytes = store->get(hashed);
            if (!bytes) return std::nullopt;
            auto entry = CacheEntry::fromJson(nlohmann::json::parse(*bytes));
            if (entry.key != key) {
                logger->warn("Cache: коллизия хеша для '{}', запись проигнорирована", key);
                return std::nullopt;
            }
            return entry;
        } catch (const nlohmann::json::exception& e) {
            logger->warn("Cache: повреждённая запись '{}' удалена: {}", key, e.what());
            diskRemove(hashed);
        } catch (const std::exception& e) {
            logger->warn("Cache: ошибка чтения '{}' ({}): {}", key, store->name(), e.what());
        }
        return std::nullopt;
    }

    void diskSet(const CacheEntry& entry) {
        if (!store) return;
        try {
            store->set(hashKey(entry.key), entry.toJson().dump(), entry.ttl);
            if (config.maxDiskBytes > 0) {
                size_t evicted = store->evictToBudget(config.maxDiskBytes);
                if (evicted > 0) {
                    evictions += evicted;
                    logger->debug("Cache: вытеснено {} записей с диска", evicted);
                }
            }
        } catch (const std::exception& e) {
            logger->warn("Cache: не удалось сохранить '{}' ({}): {}", entry.key, store->name(), e.what());
        }
    }

    bool diskRemove(const std::string& hashed) {
        if (!store) return false;
        try {
            return store->remove(hashed);
        } catch (const std::exception& e) {
            logger->warn("Cache: не удалось удалить {} ({}): {}", hashed, store->name(), e.what());
            return false;
        }
    }

    // Все записи второго уровня: (хеш, запись или nullopt для нечитаемых)
    std::vector<std::pair<std::string, std::optional<CacheEntry>>> diskEntries() {
        std::vector<std::pair<std::string, std::optional<CacheEntry>>> result;
        if (!store) return result;
        std::vector<std::string> keys;
        try {
            keys = store->keys();
        } catch (const std::exception& e) {
            logger->warn("Cache: не удалось перечислить записи ({}): {}", store->name(), e.what());
            return result;
        }
        for (const auto& hashed : keys) {
            std::optional<CacheEntry> entry;
            try {
                auto bytes = store->get(hashed);
                if (!bytes) continue;
                entry = CacheEntry::fromJson(nlohmann::json::parse(*bytes));
            } catch (const std::exception& e) {
                logger->debug("Cache: нечитаемая запись {}: {}", hashed, e.what());
            }
            result.emplace_back(hashed, std::move(entry));
        }
        return result;
    }

    // Вызывается под mutex: при превышении лимита удаляется четверть записей
    // с наименьшими (accessCount, createdAt)
    void evictMemoryIfNeeded() {
        if (memory.size() <= config.maxMemoryEntries) return;
        std::vector<std::pair<std::pair<size_t, SystemClock::time_point>, std::string>> order;
        order.reserve(memory.size());
        for (const auto& [key, entry] : memory) {
            order.push_back({{entry.accessCount, entry.createdAt}, key});
        }
        std::sort(order.begin(), order.end());
        size_t toRemove = std::max<size_t>(1, memory.size() / 4);
        for (size_t i = 0; i < toRemove && i < order.size(); ++i) {
            memory.erase(order[i].second);
        }
        evictions += toRemove;
        logger->debug("Cache: вытеснено {} записей из памяти", toRemove);
    }

    std::optional<nlohmann::json> peekMemory(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = memory.find(key);
        if (it == memory.end() || !it->second.isValid()) return std::nullopt;
        return it->second.value;
    }

    void cleanupLoop() {
        while (!stopCleanup) {
            {
                std::unique_lock<std::mutex> lock(cleanupMutex);
                cleanupCv.wait_for(lock, config.sweepInterval, [this] { return stopCleanup.load(); });
            }
            if (stopCleanup) break;
            sweepExpired();
        }
    }

    size_t sweepExpired() {
        std::set<std::string> removed;
        auto now = SystemClock::now();
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = memory.begin(); it != memory.end();) {
                if (!it->second.isValid(now)) {
                    removed.insert(it->first);
                    it = memory.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& [hashed, entry] : diskEntries()) {
            if (entry && entry->isValid(now)) continue;
            if (diskRemove(hashed)) {
                removed.insert(entry ? entry->key : hashed);
            }
        }
        if (!removed.empty()) {
            logger->debug("Cache: удалено {} истёкших записей", removed.size());
        }
        return removed.size();
    }

    void stopCleanupThread() {
        {
            std::lock_guard<std::mutex> lock(cleanupMutex);
            stopCleanup = true;
        }
        cleanupCv.notify_all();
        if (cleanupThread.joinable()) cleanupThread.join();
    }
};

namespace {

std::shared_ptr<BackingStore> makeDefaultStore(const CacheConfig& config) {
    if (!config.enableDisk) return nullptr;
    try {
        return std::make_shared<FileBackingStore>(config.storagePath, config.enableCompression, config.compressThreshold,
                                                  config.maxDiskBytes);
    } catch (const CacheIOError& e) {
        logging::getLogger("cache")->warn("Cache: дисковый уровень отключён: {}", e.what());
        return nullptr;
    }
}

} // namespace

ResourceCache::ResourceCache(const CacheConfig& config)
    : ResourceCache(config, config.validate() ? makeDefaultStore(config) : nullptr) {}

ResourceCache::ResourceCache(const CacheConfig& config, std::shared_ptr<BackingStore> store) {
    if (!config.validate()) {
        throw ConfigurationError("Некорректная конфигурация кэша");
    }
    pImpl = std::make_unique<Impl>(config, std::move(store));
    if (config.sweepInterval.count() > 0) {
        pImpl->cleanupThread = std::thread([this]() { pImpl->cleanupLoop(); });
    }
    pImpl->logger->info("ResourceCache: создан (память {} записей, второй уровень: {})",
                        config.maxMemoryEntries, pImpl->store ? pImpl->store->name() : std::string("нет"));
}

ResourceCache::~ResourceCache() {
    shutdown();
}

std::optional<nlohmann::json> ResourceCache::get(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->memory.find(key);
        if (it != pImpl->memory.end()) {
            if (it->second.isValid()) {
                ++it->second.accessCount;
                ++pImpl->hits;
                return it->second.value;
            }
            pImpl->memory.erase(it);
        }
    }

    auto entry = pImpl->diskGet(key);
    if (!entry) {
        ++pImpl->misses;
        return std::nullopt;
    }
    if (!entry->isValid()) {
        pImpl->diskRemove(hashKey(key));
        ++pImpl->misses;
        return std::nullopt;
    }

    // Поднимаем в память
    ++entry->accessCount;
    nlohmann::json value = entry->value;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->memory[key] = std::move(*entry);
        pImpl->evictMemoryIfNeeded();
    }
    ++pImpl->hits;
    pImpl->logger->debug("Cache: '{}' поднят с диска в память", key);
    return value;
}

void ResourceCache::set(const std::string& key, const nlohmann::json& value,
                        std::optional<std::chrono::milliseconds> ttl) {
    CacheEntry entry;
    entry.key = key;
    entry.value = value;
    entry.createdAt = SystemClock::now();
    entry.ttl = ttl ? *ttl : pImpl->config.defaultTtl;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->memory[key] = entry;
        pImpl->evictMemoryIfNeeded();
    }
    pImpl->diskSet(entry);
}

nlohmann::json ResourceCache::getOrCompute(const std::string& key, Compute compute,
                                           std::optional<std::chrono::milliseconds> ttl,
                                           bool forceRefresh) {
    if (!forceRefresh) {
        if (auto cached = get(key)) {
            return *cached;
        }
    }

    std::promise<nlohmann::json> promise;
    {
        std::unique_lock<std::mutex> lock(pImpl->inflightMutex);
        auto it = pImpl->inflight.find(key);
        if (it != pImpl->inflight.end()) {
            auto future = it->second;
            lock.unlock();
            pImpl->logger->debug("Cache: '{}' уже вычисляется, ожидаем", key);
            return future.get();
        }
        if (!forceRefresh) {
            // Другой лидер мог завершиться между промахом и захватом
            if (auto cached = pImpl->peekMemory(key)) {
                return *cached;
            }
        }
        pImpl->inflight.emplace(key, promise.get_future().share());
    }

    try {
        nlohmann::json value = compute();
        ++pImpl->computeCount;
        set(key, value, ttl);
        {
            std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
            pImpl->inflight.erase(key);
        }
        promise.set_value(value);
        return value;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
            pImpl->inflight.erase(key);
        }
        promise.set_exception(std::current_exception());
        pImpl->logger->warn("Cache: вычисление '{}' завершилось ошибкой: {}", key,
                            TaskFailedError::describe(std::current_exception()));
        throw;
    }
}

bool ResourceCache::remove(const std::string& key) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        removed = pImpl->memory.erase(key) > 0;
    }
    removed = pImpl->diskRemove(hashKey(key)) || removed;
    return removed;
}

size_t ResourceCache::clearExpired() {
    return pImpl->sweepExpired();
}

size_t ResourceCache::clearPattern(const std::string& pattern) {
    std::set<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto it = pImpl->memory.begin(); it != pImpl->memory.end();) {
            if (fnmatch(pattern.c_str(), it->first.c_str(), 0) == 0) {
                removed.insert(it->first);
                it = pImpl->memory.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [hashed, entry] : pImpl->diskEntries()) {
        if (!entry) continue;
        if (fnmatch(pattern.c_str(), entry->key.c_str(), 0) == 0 && pImpl->diskRemove(hashed)) {
            removed.insert(entry->key);
        }
    }
    pImpl->logger->info("Cache: по шаблону '{}' удалено {} записей", pattern, removed.size());
    return removed.size();
}

void ResourceCache::clear() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->memory.clear();
    }
    if (pImpl->store) {
        try {
            pImpl->store->clear();
        } catch (const std::exception& e) {
            pImpl->logger->warn("Cache: не удалось очистить {}: {}", pImpl->store->name(), e.what());
        }
    }
    pImpl->logger->info("Cache: очищен");
}

CacheMetrics ResourceCache::getStats() const {
    CacheMetrics metrics;
    metrics.hits = pImpl->hits;
    metrics.misses = pImpl->misses;
    size_t requests = metrics.hits + metrics.misses;
    metrics.hitRate = requests > 0 ? static_cast<double>(metrics.hits) / static_cast<double>(requests) : 0.0;
    metrics.evictions = pImpl->evictions;
    metrics.computeCount = pImpl->computeCount;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        metrics.memoryEntries = pImpl->memory.size();
    }
    if (pImpl->store) {
        try {
            metrics.diskEntries = pImpl->store->keys().size();
            metrics.diskBytes = pImpl->store->totalBytes();
        } catch (const std::exception& e) {
            pImpl->logger->warn("Cache: статистика второго уровня недоступна: {}", e.what());
        }
    }
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

const CacheConfig& ResourceCache::config() const {
    return pImpl->config;
}

void ResourceCache::shutdown() {
    pImpl->stopCleanupThread();
}

} // namespace cache
} // namespace ignition
