#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ignition/common/Logging.hpp"
#include "ignition/scheduler/TaskTypes.hpp"
#include "ignition/cache/CacheConfig.hpp"
#include "ignition/loader/ComponentTypes.hpp"
#include "ignition/pool/ComponentPool.hpp"

namespace ignition {
namespace config {

// IgnitionConfig: конфигурация процесса, все секции необязательны
struct IgnitionConfig {
    logging::LoggingConfig logging;        // "logging"
    scheduler::SchedulerConfig scheduler;  // "scheduler"
    cache::CacheConfig cache;              // "cache"
    loader::LoaderConfig loader;           // "loader"
    std::vector<pool::PoolSettings> pools; // "pools": только лимиты по видам

    bool validate() const;
    nlohmann::json toJson() const;
    // ConfigurationError при неверных типах или значениях
    static IgnitionConfig fromJson(const nlohmann::json& j);
};

// Прочитать JSON-файл; ConfigurationError, если файл не открыт или не разобран
IgnitionConfig loadConfigFile(const std::string& path);

// Применить лимиты из конфигурации к настройкам пула с тем же kind
void applyPoolLimits(const IgnitionConfig& config, pool::PoolSettings& settings);

} // namespace config
} // namespace ignition
