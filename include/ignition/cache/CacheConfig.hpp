#pragma once
#include <string>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ignition {
namespace cache {

// CacheConfig: параметры кэша (лимиты уровней, TTL, хранилище, сжатие)
struct CacheConfig {
    size_t maxMemoryEntries = 100;                 // Макс. записей в памяти
    size_t maxDiskBytes = 50 * 1024 * 1024;        // Бюджет диска (50 MB)
    std::chrono::milliseconds defaultTtl = std::chrono::seconds(3600); // TTL по умолчанию (1 час)
    bool enableDisk = true;                        // Дисковый уровень
    bool enableCompression = false;                // Сжатие zlib
    size_t compressThreshold = 1024;               // Сжимать записи больше (байт)
    std::string storagePath = "./cache";           // Путь
    std::chrono::milliseconds sweepInterval = std::chrono::seconds(60); // Фоновая очистка (0 = выкл.)
    bool validate() const {
        if (maxMemoryEntries == 0 || defaultTtl.count() <= 0 || sweepInterval.count() < 0) return false;
        if (enableDisk && (storagePath.empty() || maxDiskBytes == 0)) return false;
        return true;
    }
    nlohmann::json toJson() const {
        return {
            {"maxMemoryEntries", maxMemoryEntries},
            {"maxDiskBytes", maxDiskBytes},
            {"defaultTtlMs", defaultTtl.count()},
            {"enableDisk", enableDisk},
            {"enableCompression", enableCompression},
            {"compressThreshold", compressThreshold},
            {"storagePath", storagePath},
            {"sweepIntervalMs", sweepInterval.count()}
        };
    }
    static CacheConfig fromJson(const nlohmann::json& j) {
        CacheConfig config;
        config.maxMemoryEntries = j.value("maxMemoryEntries", config.maxMemoryEntries);
        config.maxDiskBytes = j.value("maxDiskBytes", config.maxDiskBytes);
        config.defaultTtl = std::chrono::milliseconds(j.value("defaultTtlMs", config.defaultTtl.count()));
        config.enableDisk = j.value("enableDisk", config.enableDisk);
        config.enableCompression = j.value("enableCompression", config.enableCompression);
        config.compressThreshold = j.value("compressThreshold", config.compressThreshold);
        config.storagePath = j.value("storagePath", config.storagePath);
        config.sweepInterval = std::chrono::milliseconds(j.value("sweepIntervalMs", config.sweepInterval.count()));
        return config;
    }
};

} // namespace cache
} // namespace ignition
