#include "ignition/cache/FileBackingStore.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <zlib.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdint>

namespace fs = std::filesystem;

namespace ignition {
namespace cache {

namespace {

// Заголовок сжатой записи: магия + исходный размер (8 байт, little-endian)
const std::string kCompressedMagic = "IGZ1";
constexpr size_t kHeaderSize = 4 + 8;
// Предельная степень сжатия deflate
constexpr uint64_t kMaxDeflateRatio = 1032;
const std::string kExtension = ".cache";

} // namespace

FileBackingStore::FileBackingStore(const fs::path& directory, bool enableCompression, size_t compressThreshold,
                                   size_t maxEntryBytes)
    : directory_(directory), enableCompression_(enableCompression), compressThreshold_(compressThreshold),
      maxEntryBytes_(maxEntryBytes) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw CacheIOError("Не удалось создать каталог кэша " + directory_.string() + ": " + ec.message());
    }
}

fs::path FileBackingStore::pathFor(const std::string& hashKey) const {
    return directory_ / (hashKey + kExtension);
}

std::optional<std::string> FileBackingStore::get(const std::string& hashKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = pathFor(hashKey);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CacheIOError("Не удалось открыть " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw CacheIOError("Ошибка чтения " + path.string());
    }
    file.close();
    try {
        return decompress(buffer.str());
    } catch (const CacheIOError& e) {
        fs::remove(path, ec);
        logging::getLogger("cache")->warn("FileBackingStore: запись {} удалена: {}", hashKey, e.what());
        return std::nullopt;
    }
}

void FileBackingStore::set(const std::string& hashKey, const std::string& bytes, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = pathFor(hashKey);
    auto tmp = path;
    tmp += ".tmp";
    std::string payload = (enableCompression_ && bytes.size() > compressThreshold_) ? compress(bytes) : bytes;
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw CacheIOError("Не удалось открыть " + tmp.string() + " на запись");
        }
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        if (!file) {
            throw CacheIOError("Ошибка записи " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw CacheIOError("Не удалось переименовать " + tmp.string() + " -> " + path.string());
    }
}

bool FileBackingStore::remove(const std::string& hashKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    bool removed = fs::remove(pathFor(hashKey), ec);
    if (ec) {
        throw CacheIOError("Не удалось удалить запись " + hashKey + ": " + ec.message());
    }
    return removed;
}

std::vector<std::string> FileBackingStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == kExtension) {
            result.push_back(it->path().stem().string());
        }
    }
    if (ec) {
        throw CacheIOError("Не удалось прочитать каталог " + directory_.string() + ": " + ec.message());
    }
    return result;
}

size_t FileBackingStore::totalBytes() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == kExtension) {
            std::error_code sizeEc;
            auto size = it->file_size(sizeEc);
            if (!sizeEc) total += static_cast<size_t>(size);
        }
    }
    if (ec) {
        throw CacheIOError("Не удалось прочитать каталог " + directory_.string() + ": " + ec.message());
    }
    return total;
}

size_t FileBackingStore::evictToBudget(size_t maxBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    struct FileInfo {
        fs::file_time_type modified;
        fs::path path;
        size_t size;
    };
    std::vector<FileInfo> files;
    size_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || it->path().extension() != kExtension) continue;
        std::error_code infoEc;
        auto size = static_cast<size_t>(it->file_size(infoEc));
        auto modified = it->last_write_time(infoEc);
        if (infoEc) continue;
        files.push_back({modified, it->path(), size});
        total += size;
    }
    if (ec) {
        throw CacheIOError("Не удалось прочитать каталог " + directory_.string() + ": " + ec.message());
    }
    if (total <= maxBytes) return 0;

    std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.modified < b.modified;
    });
    size_t removed = 0;
    for (const auto& file : files) {
        if (total <= maxBytes) break;
        std::error_code removeEc;
        if (fs::remove(file.path, removeEc)) {
            total -= file.size;
            ++removed;
        }
    }
    return removed;
}

void FileBackingStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == kExtension) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        throw CacheIOError("Не удалось прочитать каталог " + directory_.string() + ": " + ec.message());
    }
    for (const auto& path : doomed) {
        std::error_code removeEc;
        fs::remove(path, removeEc);
    }
}

std::string FileBackingStore::compress(const std::string& bytes) const {
    uLongf bound = compressBound(static_cast<uLong>(bytes.size()));
    std::string out(kHeaderSize + bound, '\0');
    std::copy(kCompressedMagic.begin(), kCompressedMagic.end(), out.begin());
    uint64_t original = bytes.size();
    for (size_t i = 0; i < 8; ++i) {
        out[4 + i] = static_cast<char>((original >> (8 * i)) & 0xFF);
    }
    int rc = compress2(reinterpret_cast<Bytef*>(&out[kHeaderSize]), &bound,
                       reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uLong>(bytes.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        throw CacheIOError("zlib compress2 вернул " + std::to_string(rc));
    }
    out.resize(kHeaderSize + bound);
    return out;
}

std::string FileBackingStore::decompress(const std::string& stored) const {
    if (stored.size() < kHeaderSize || stored.compare(0, kCompressedMagic.size(), kCompressedMagic) != 0) {
        return stored;
    }
    uint64_t original = 0;
    for (size_t i = 0; i < 8; ++i) {
        original |= static_cast<uint64_t>(static_cast<unsigned char>(stored[4 + i])) << (8 * i);
    }
    uint64_t payload = stored.size() - kHeaderSize;
    if (original > payload * kMaxDeflateRatio || (maxEntryBytes_ > 0 && original > maxEntryBytes_)) {
        throw CacheIOError("Недопустимый размер сжатой записи кэша: " + std::to_string(original));
    }
    std::string out(static_cast<size_t>(original), '\0');
    uLongf length = static_cast<uLongf>(original);
    int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &length,
                        reinterpret_cast<const Bytef*>(stored.data() + kHeaderSize),
                        static_cast<uLong>(stored.size() - kHeaderSize));
    if (rc != Z_OK || length != original) {
        throw CacheIOError("Повреждённая сжатая запись кэша (zlib " + std::to_string(rc) + ")");
    }
    return out;
}

} // namespace cache
} // namespace ignition
