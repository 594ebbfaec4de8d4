#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace ignition {
namespace cache {

// CacheMetrics: метрики кэша (попадания, промахи, hit rate, вытеснения, уровни)
struct CacheMetrics {
    size_t hits = 0;          // Попадания
    size_t misses = 0;        // Промахи
    double hitRate = 0.0;     // Hit rate
    size_t evictions = 0;     // Кол-во вытеснений
    size_t memoryEntries = 0; // Записей в памяти
    size_t diskEntries = 0;   // Записей на диске
    size_t diskBytes = 0;     // Байт на диске
    size_t computeCount = 0;  // Вызовов compute
    std::chrono::steady_clock::time_point lastUpdate; // Последнее обновление
    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"hitRate", hitRate},
            {"evictions", evictions},
            {"memoryEntries", memoryEntries},
            {"diskEntries", diskEntries},
            {"diskBytes", diskBytes},
            {"computeCount", computeCount},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace ignition
