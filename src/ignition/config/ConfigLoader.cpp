#include "ignition/config/ConfigLoader.hpp"
#include "ignition/common/Errors.hpp"
#include <fstream>

namespace ignition {
namespace config {

bool IgnitionConfig::validate() const {
    if (!logging.validate() || !scheduler.validate() || !cache.validate() || !loader.validate()) {
        return false;
    }
    for (const auto& settings : pools) {
        if (settings.kind.empty() || settings.maxSize == 0 || settings.ttl.count() <= 0) return false;
    }
    return true;
}

nlohmann::json IgnitionConfig::toJson() const {
    nlohmann::json poolsJson = nlohmann::json::array();
    for (const auto& settings : pools) poolsJson.push_back(settings.toJson());
    return {
        {"logging", logging.toJson()},
        {"scheduler", scheduler.toJson()},
        {"cache", cache.toJson()},
        {"loader", loader.toJson()},
        {"pools", poolsJson}
    };
}

IgnitionConfig IgnitionConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Конфигурация должна быть JSON-объектом");
    }
    IgnitionConfig config;
    try {
        if (j.contains("logging")) config.logging = logging::LoggingConfig::fromJson(j.at("logging"));
        if (j.contains("scheduler")) config.scheduler = scheduler::SchedulerConfig::fromJson(j.at("scheduler"));
        if (j.contains("cache")) config.cache = cache::CacheConfig::fromJson(j.at("cache"));
        if (j.contains("loader")) config.loader = loader::LoaderConfig::fromJson(j.at("loader"));
        if (j.contains("pools")) {
            for (const auto& entry : j.at("pools")) {
                config.pools.push_back(pool::PoolSettings::fromJson(entry));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Неверный тип значения в конфигурации: ") + e.what());
    }
    if (!config.validate()) {
        throw ConfigurationError("Недопустимые значения в конфигурации");
    }
    return config;
}

IgnitionConfig loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Ошибка разбора " + path + ": " + e.what());
    }
    auto config = IgnitionConfig::fromJson(j);
    logging::getLogger("config")->info("Config: загружен {}", path);
    return config;
}

void applyPoolLimits(const IgnitionConfig& config, pool::PoolSettings& settings) {
    for (const auto& limits : config.pools) {
        if (limits.kind == settings.kind) {
            settings.maxSize = limits.maxSize;
            settings.ttl = limits.ttl;
            return;
        }
    }
}

} // namespace config
} // namespace ignition
