#pragma once
#include <filesystem>
#include <mutex>
#include "ignition/cache/BackingStore.hpp"

namespace ignition {
namespace cache {

// FileBackingStore: один файл <sha256>.cache на запись в каталоге storagePath.
// Индекса нет: наличие файла и есть наличие записи.
// Записи больше compressThreshold сжимаются zlib, если сжатие включено.
// Повреждённая сжатая запись удаляется при чтении и считается промахом
class FileBackingStore : public BackingStore {
public:
    // maxEntryBytes: предел распакованного размера записи (0 - без предела)
    FileBackingStore(const std::filesystem::path& directory, bool enableCompression = false,
                     size_t compressThreshold = 1024, size_t maxEntryBytes = 0);
    std::optional<std::string> get(const std::string& hashKey) override;
    void set(const std::string& hashKey, const std::string& bytes, std::chrono::milliseconds ttl) override;
    bool remove(const std::string& hashKey) override;
    std::vector<std::string> keys() override;
    size_t totalBytes() override;
    size_t evictToBudget(size_t maxBytes) override;
    void clear() override;
    std::string name() const override { return "file"; }

    std::filesystem::path pathFor(const std::string& hashKey) const; // Путь файла записи
    const std::filesystem::path& directory() const { return directory_; }
private:
    std::string compress(const std::string& bytes) const;
    std::string decompress(const std::string& stored) const;
    std::filesystem::path directory_;
    bool enableCompression_;
    size_t compressThreshold_;
    size_t maxEntryBytes_;
    std::mutex mutex_;
};

} // namespace cache
} // namespace ignition
