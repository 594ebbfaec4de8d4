#include "ignition/cache/MemoryBackingStore.hpp"
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace ignition {
namespace cache {

std::string hashKey(const std::string& key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::optional<std::string> MemoryBackingStore::get(const std::string& hashKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(hashKey);
    if (it == slots_.end()) return std::nullopt;
    return it->second.bytes;
}

void MemoryBackingStore::set(const std::string& hashKey, const std::string& bytes, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[hashKey] = Slot{bytes, std::chrono::steady_clock::now()};
}

bool MemoryBackingStore::remove(const std::string& hashKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.erase(hashKey) > 0;
}

std::vector<std::string> MemoryBackingStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) result.push_back(key);
    return result;
}

size_t MemoryBackingStore::totalBytes() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [key, slot] : slots_) total += slot.bytes.size();
    return total;
}

size_t MemoryBackingStore::evictToBudget(size_t maxBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>> byAge;
    for (const auto& [key, slot] : slots_) {
        total += slot.bytes.size();
        byAge.emplace_back(slot.modified, key);
    }
    if (total <= maxBytes) return 0;
    std::sort(byAge.begin(), byAge.end());
    size_t removed = 0;
    for (const auto& [modified, key] : byAge) {
        if (total <= maxBytes) break;
        total -= slots_[key].bytes.size();
        slots_.erase(key);
        ++removed;
    }
    return removed;
}

void MemoryBackingStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
}

} // namespace cache
} // namespace ignition
