#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "ignition/cache/CacheConfig.hpp"
#include "ignition/cache/CacheMetrics.hpp"
#include "ignition/cache/BackingStore.hpp"

namespace ignition {
namespace cache {

// ResourceCache: двухуровневый кэш (память + BackingStore) с TTL на запись.
// Попадание на диске поднимается в память. Ошибки второго уровня
// логируются и считаются промахом. getOrCompute защищён от "cache stampede":
// конкурентные вызовы для одного ключа разделяют одно вычисление
class ResourceCache {
public:
    using Compute = std::function<nlohmann::json()>;

    // Второй уровень создаётся по config (FileBackingStore в storagePath), если enableDisk
    explicit ResourceCache(const CacheConfig& config = CacheConfig{});
    // Второй уровень внедряется явно; nullptr = только память
    ResourceCache(const CacheConfig& config, std::shared_ptr<BackingStore> store);
    ~ResourceCache(); // Деструктор
    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    // Вернуть значение или вычислить его; ошибка compute пробрасывается всем ожидающим
    nlohmann::json getOrCompute(const std::string& key, Compute compute,
                                std::optional<std::chrono::milliseconds> ttl = std::nullopt,
                                bool forceRefresh = false);
    std::optional<nlohmann::json> get(const std::string& key); // Получить
    void set(const std::string& key, const nlohmann::json& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt); // Сохранить
    bool remove(const std::string& key); // Удалить с обоих уровней
    size_t clearExpired(); // Удалить истёкшие записи
    size_t clearPattern(const std::string& pattern); // Удалить ключи по glob-шаблону
    void clear(); // Очистить
    CacheMetrics getStats() const; // Метрики
    const CacheConfig& config() const;
    void shutdown(); // Остановить фоновую очистку
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace ignition
