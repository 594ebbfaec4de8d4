#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <type_traits>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "ignition/common/Capabilities.hpp"

namespace ignition {
namespace pool {

using Instance = std::shared_ptr<void>;
using InstanceFactory = std::function<Instance()>;
using InstanceHook = std::function<void(Instance&)>;

// PoolSettings: параметры пула одного вида компонентов
struct PoolSettings {
    std::string kind;                                         // Вид
    InstanceFactory factory;                                  // Фабрика
    InstanceHook reset;                                       // Сброс перед повторной выдачей (опц.)
    InstanceHook cleanup;                                     // Освобождение при вытеснении (опц.)
    size_t maxSize = 50;                                      // Макс. свободных экземпляров
    std::chrono::milliseconds ttl = std::chrono::seconds(300); // Макс. простой
    bool validate() const {
        return !kind.empty() && static_cast<bool>(factory) && maxSize > 0 && ttl.count() > 0;
    }
    nlohmann::json toJson() const {
        return {{"kind", kind}, {"maxSize", maxSize}, {"ttlMs", ttl.count()}};
    }
    // Только лимиты; factory и hooks задаются кодом
    static PoolSettings fromJson(const nlohmann::json& j) {
        PoolSettings settings;
        settings.kind = j.value("kind", settings.kind);
        settings.maxSize = j.value("maxSize", settings.maxSize);
        settings.ttl = std::chrono::milliseconds(j.value("ttlMs", settings.ttl.count()));
        return settings;
    }
};

// PoolStats: статистика вида
struct PoolStats {
    size_t created = 0;       // Создано фабрикой
    size_t recycled = 0;      // Выдано повторно
    size_t available = 0;     // Свободно
    size_t inUse = 0;         // Выдано сейчас
    size_t peakUsage = 0;     // Пик одновременно выданных
    double recycleRatio = 0.0;
    nlohmann::json toJson() const {
        return {
            {"created", created},
            {"recycled", recycled},
            {"available", available},
            {"inUse", inUse},
            {"peakUsage", peakUsage},
            {"recycleRatio", recycleRatio}
        };
    }
};

// ComponentPool: пул переиспользуемых экземпляров по видам.
// Пул владеет свободными экземплярами и отслеживает выданные;
// acquire никогда не блокируется на пустом пуле
class ComponentPool {
public:
    struct Options {
        std::chrono::milliseconds sweepInterval = std::chrono::seconds(60); // 0 = без фонового потока
    };

    ComponentPool(); // Конструктор
    explicit ComponentPool(const Options& options); // Конструктор
    ~ComponentPool(); // Деструктор
    ComponentPool(const ComponentPool&) = delete;
    ComponentPool& operator=(const ComponentPool&) = delete;

    void registerPool(PoolSettings settings); // Зарегистрировать вид
    bool hasPool(const std::string& kind) const;

    // Resettable/Cleanable проверяются здесь один раз
    template<typename T>
    void registerTypedPool(const std::string& kind, std::function<std::shared_ptr<T>()> factory,
                           size_t maxSize = 50,
                           std::chrono::milliseconds ttl = std::chrono::seconds(300)) {
        PoolSettings settings;
        settings.kind = kind;
        settings.maxSize = maxSize;
        settings.ttl = ttl;
        settings.factory = [factory = std::move(factory)]() -> Instance { return factory(); };
        if constexpr (std::is_base_of_v<Resettable, T>) {
            settings.reset = [](Instance& instance) { std::static_pointer_cast<T>(instance)->reset(); };
        }
        if constexpr (std::is_base_of_v<Cleanable, T>) {
            settings.cleanup = [](Instance& instance) { std::static_pointer_cast<T>(instance)->cleanup(); };
        }
        registerPool(std::move(settings));
    }

    // nullptr только для неизвестного вида или упавшей фабрики
    Instance acquire(const std::string& kind);

    template<typename T>
    std::shared_ptr<T> acquireAs(const std::string& kind) {
        return std::static_pointer_cast<T>(acquire(kind));
    }

    bool release(const std::string& kind, const Instance& instance); // Вернуть в пул

    template<typename T>
    bool release(const std::string& kind, const std::shared_ptr<T>& instance) {
        return release(kind, std::static_pointer_cast<void>(instance));
    }

    // Уничтожить свободные экземпляры вида (или всех). PoolTimeoutError при таймауте блокировки
    size_t forceCleanup(const std::optional<std::string>& kind = std::nullopt,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    size_t sweepExpired(); // Вытеснить простаивающие дольше TTL

    std::map<std::string, PoolStats> getStats() const;
    std::optional<PoolStats> getStats(const std::string& kind) const;
    nlohmann::json statsToJson() const;

    void shutdown(); // Остановить фоновую очистку и освободить свободные экземпляры
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace pool
} // namespace ignition
