#pragma once

#include <any>
#include <array>
#include <map>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <exception>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ignition {
namespace loader {

// Уровни приоритета, обходятся строго по возрастанию
enum class Priority {
    Critical = 0,
    High = 1,
    Medium = 2,
    Low = 3,
    Deferred = 4
};

constexpr std::array<Priority, 5> kAllPriorities = {
    Priority::Critical, Priority::High, Priority::Medium, Priority::Low, Priority::Deferred
};

inline const char* toString(Priority priority) {
    switch (priority) {
        case Priority::Critical: return "critical";
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
        case Priority::Deferred: return "deferred";
    }
    return "unknown";
}

inline std::optional<Priority> priorityFromString(const std::string& name) {
    for (auto priority : kAllPriorities) {
        if (name == toString(priority)) return priority;
    }
    return std::nullopt;
}

using LoaderFunction = std::function<std::any()>;
using SkeletonCallback = std::function<void()>;
using PreloadHook = std::function<void()>;

// CacheCodec: преобразование значения компонента в JSON для кэша и обратно
struct CacheCodec {
    std::function<nlohmann::json(const std::any&)> encode;
    std::function<std::any(const nlohmann::json&)> decode;
};

// ComponentConfig: описание компонента, неизменяемо после регистрации
struct ComponentConfig {
    std::string name;                          // Уникальное имя
    Priority priority = Priority::Medium;      // Уровень
    LoaderFunction loader;                     // Загрузчик
    std::vector<std::string> dependencies;     // Зависимости
    std::optional<std::string> cacheKey;       // Ключ кэша
    bool preloadData = false;                  // Вызвать preloader перед загрузчиком
    PreloadHook preloader;                     // Подготовка данных
    SkeletonCallback skeleton;                 // Заглушка (только Critical)
    std::optional<CacheCodec> codec;           // Кодек для кэша, если значение не JSON
    std::optional<std::string> poolKind;       // Брать экземпляр из ComponentPool
    bool validate() const {
        if (name.empty()) return false;
        if (!loader && !poolKind) return false;
        if (codec && (!codec->encode || !codec->decode)) return false;
        return true;
    }
};

// LoaderConfig: параметры прогрессивной загрузки
struct LoaderConfig {
    std::chrono::milliseconds cacheTtl = std::chrono::hours(1);                 // TTL результатов в кэше
    std::chrono::milliseconds interactiveBudget = std::chrono::milliseconds(2000); // Цель "interactive"
    std::optional<std::chrono::milliseconds> componentTimeout;                  // Таймаут компонента в уровне
    bool sweepDeferred = true;                                                  // Обходить Deferred в start()
    bool validate() const {
        if (cacheTtl.count() <= 0 || interactiveBudget.count() <= 0) return false;
        if (componentTimeout && componentTimeout->count() <= 0) return false;
        return true;
    }
    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"cacheTtlMs", cacheTtl.count()},
            {"interactiveBudgetMs", interactiveBudget.count()},
            {"sweepDeferred", sweepDeferred}
        };
        if (componentTimeout) j["componentTimeoutMs"] = componentTimeout->count();
        return j;
    }
    static LoaderConfig fromJson(const nlohmann::json& j) {
        LoaderConfig config;
        config.cacheTtl = std::chrono::milliseconds(j.value("cacheTtlMs", config.cacheTtl.count()));
        config.interactiveBudget = std::chrono::milliseconds(
            j.value("interactiveBudgetMs", config.interactiveBudget.count()));
        if (j.contains("componentTimeoutMs") && !j.at("componentTimeoutMs").is_null()) {
            config.componentTimeout = std::chrono::milliseconds(j.at("componentTimeoutMs").get<long long>());
        }
        config.sweepDeferred = j.value("sweepDeferred", config.sweepDeferred);
        return config;
    }
};

// LoaderStats: итоги загрузки
struct LoaderStats {
    double totalTimeMs = 0.0;
    std::optional<double> skeletonShownMs;          // От start() до первой заглушки
    std::optional<double> interactiveMs;            // От start() до конца уровня High
    size_t loadedCount = 0;
    size_t totalCount = 0;
    size_t failedCount = 0;
    std::map<std::string, double> perComponentMs;
    double averageLoadTimeMs = 0.0;
    bool targetMet = false;                         // interactiveMs < interactiveBudget
    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"totalTimeMs", totalTimeMs},
            {"loadedCount", loadedCount},
            {"totalCount", totalCount},
            {"failedCount", failedCount},
            {"perComponentMs", perComponentMs},
            {"averageLoadTimeMs", averageLoadTimeMs},
            {"targetMet", targetMet}
        };
        j["skeletonShownMs"] = skeletonShownMs ? nlohmann::json(*skeletonShownMs) : nlohmann::json();
        j["interactiveMs"] = interactiveMs ? nlohmann::json(*interactiveMs) : nlohmann::json();
        return j;
    }
};

using ProgressCallback = std::function<void(const std::string&, double)>;
using CompletionCallback = std::function<void(const std::string&, const std::any&)>;
using ErrorCallback = std::function<void(const std::string&, std::exception_ptr)>;

} // namespace loader
} // namespace ignition
