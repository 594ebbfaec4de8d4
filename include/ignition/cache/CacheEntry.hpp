#pragma once
#include <string>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ignition {
namespace cache {

using SystemClock = std::chrono::system_clock;

// CacheEntry: значение с моментом создания, TTL и счётчиком обращений
struct CacheEntry {
    std::string key;
    nlohmann::json value;
    SystemClock::time_point createdAt = SystemClock::now();
    std::chrono::milliseconds ttl{0};
    size_t accessCount = 0;

    // Запись действительна строго до createdAt + ttl
    bool isValid(SystemClock::time_point now = SystemClock::now()) const {
        return now < createdAt + ttl;
    }

    nlohmann::json toJson() const {
        return {
            {"key", key},
            {"value", value},
            {"createdAt", std::chrono::duration_cast<std::chrono::milliseconds>(createdAt.time_since_epoch()).count()},
            {"ttlMs", ttl.count()},
            {"accessCount", accessCount}
        };
    }

    static CacheEntry fromJson(const nlohmann::json& j) {
        CacheEntry entry;
        entry.key = j.at("key").get<std::string>();
        entry.value = j.at("value");
        entry.createdAt = SystemClock::time_point(std::chrono::milliseconds(j.at("createdAt").get<long long>()));
        entry.ttl = std::chrono::milliseconds(j.at("ttlMs").get<long long>());
        entry.accessCount = j.value("accessCount", static_cast<size_t>(0));
        return entry;
    }
};

} // namespace cache
} // namespace ignition
