#pragma once
#include <map>
#include <mutex>
#include "ignition/cache/BackingStore.hpp"

namespace ignition {
namespace cache {

// MemoryBackingStore: второй уровень в памяти процесса (для тестов и окружений без диска)
class MemoryBackingStore : public BackingStore {
public:
    std::optional<std::string> get(const std::string& hashKey) override;
    void set(const std::string& hashKey, const std::string& bytes, std::chrono::milliseconds ttl) override;
    bool remove(const std::string& hashKey) override;
    std::vector<std::string> keys() override;
    size_t totalBytes() override;
    size_t evictToBudget(size_t maxBytes) override;
    void clear() override;
    std::string name() const override { return "memory"; }
private:
    struct Slot {
        std::string bytes;
        std::chrono::steady_clock::time_point modified;
    };
    std::map<std::string, Slot> slots_;
    std::mutex mutex_;
};

} // namespace cache
} // namespace ignition
