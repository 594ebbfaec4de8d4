#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <thread>
#include <string>
#include "ignition/cache/FileBackingStore.hpp"
#include "ignition/cache/MemoryBackingStore.hpp"

using namespace ignition::cache;
namespace fs = std::filesystem;

namespace {

fs::path scratchDirectory(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = fs::temp_directory_path() / ("ignition_" + name + "_" + std::to_string(stamp));
    fs::remove_all(path);
    return path;
}

} // namespace

void testHashKeyIsDeterministic() {
    std::cout << "Testing hashKey...\n";

    auto hashed = hashKey("weather:current");
    assert(hashed.size() == 64);
    assert(hashed == hashKey("weather:current"));
    assert(hashed != hashKey("weather:forecast"));
    // SHA-256("abc")
    assert(hashKey("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "[OK] hashKey test\n";
}

void testMemoryStore() {
    std::cout << "Testing MemoryBackingStore...\n";

    MemoryBackingStore store;
    store.set("a", "1111", std::chrono::seconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    store.set("b", "22", std::chrono::seconds(1));
    assert(store.get("a") == std::optional<std::string>("1111"));
    assert(!store.get("missing"));
    assert(store.totalBytes() == 6);
    assert(store.keys().size() == 2);

    // Самая старая запись уходит первой
    assert(store.evictToBudget(3) == 1);
    assert(!store.get("a"));
    assert(store.get("b"));
    assert(store.remove("b"));
    assert(!store.remove("b"));
    assert(store.totalBytes() == 0);

    std::cout << "[OK] MemoryBackingStore test\n";
}

void testFileStoreLayout() {
    std::cout << "Testing FileBackingStore layout...\n";

    auto dir = scratchDirectory("file_store");
    {
        FileBackingStore store(dir);
        assert(fs::exists(dir));
        auto hashed = hashKey("theme");
        store.set(hashed, R"({"palette":"dark"})", std::chrono::seconds(10));

        auto path = store.pathFor(hashed);
        assert(path.filename() == hashed + ".cache");
        assert(fs::exists(path));
        assert(store.get(hashed) == std::optional<std::string>(R"({"palette":"dark"})"));
        assert((store.keys() == std::vector<std::string>{hashed}));
        assert(store.totalBytes() > 0);

        // Посторонние файлы не считаются записями
        std::ofstream(dir / "notes.txt") << "ignore me";
        assert(store.keys().size() == 1);

        assert(store.remove(hashed));
        assert(!fs::exists(path));
        assert(!store.get(hashed));
    }
    fs::remove_all(dir);

    std::cout << "[OK] FileBackingStore layout test\n";
}

void testFileStoreCompression() {
    std::cout << "Testing FileBackingStore compression...\n";

    auto dir = scratchDirectory("file_store_z");
    {
        FileBackingStore store(dir, true, 64);
        std::string large(4096, 'x');
        std::string small = "tiny";
        store.set("large", large, std::chrono::seconds(10));
        store.set("small", small, std::chrono::seconds(10));

        assert(fs::file_size(store.pathFor("large")) < large.size());
        assert(fs::file_size(store.pathFor("small")) == small.size());
        assert(store.get("large") == std::optional<std::string>(large));
        assert(store.get("small") == std::optional<std::string>(small));

        // Несжатый экземпляр читает сжатые записи
        FileBackingStore plain(dir);
        assert(plain.get("large") == std::optional<std::string>(large));

        store.clear();
        assert(store.keys().empty());
    }
    fs::remove_all(dir);

    std::cout << "[OK] FileBackingStore compression test\n";
}

void testFileStoreBudget() {
    std::cout << "Testing FileBackingStore budget...\n";

    auto dir = scratchDirectory("file_store_budget");
    {
        FileBackingStore store(dir);
        store.set("old", std::string(100, 'a'), std::chrono::seconds(10));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        store.set("new", std::string(100, 'b'), std::chrono::seconds(10));

        assert(store.totalBytes() == 200);
        assert(store.evictToBudget(150) == 1);
        assert(!store.get("old"));
        assert(store.get("new"));
    }
    fs::remove_all(dir);

    std::cout << "[OK] FileBackingStore budget test\n";
}

void testFileStoreCorruptEntries() {
    std::cout << "Testing FileBackingStore corrupt entries...\n";

    auto dir = scratchDirectory("file_store_corrupt");
    {
        FileBackingStore store(dir, true, 64, 1024);
        auto writeRaw = [&](const std::string& key, const std::string& bytes) {
            std::ofstream file(store.pathFor(key), std::ios::binary | std::ios::trunc);
            file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        };

        // Заголовок заявляет ~2^62 байт при мусорном содержимом
        std::string huge = "IGZ1";
        huge += std::string("\x00\x00\x00\x00\x00\x00\x00\x40", 8);
        huge += "garbage";
        writeRaw("huge", huge);

        // Правдоподобный размер, но поток zlib битый
        std::string broken = "IGZ1";
        broken += std::string("\x10\x00\x00\x00\x00\x00\x00\x00", 8);
        broken += "not a zlib stream";
        writeRaw("broken", broken);

        assert(!store.get("huge"));
        assert(!fs::exists(store.pathFor("huge")));
        assert(!store.get("broken"));
        assert(!fs::exists(store.pathFor("broken")));

        // Корректная запись больше предела распакованного размера
        FileBackingStore unbounded(dir, true, 64);
        unbounded.set("oversized", std::string(4096, 'z'), std::chrono::seconds(10));
        assert(unbounded.get("oversized"));
        assert(!store.get("oversized"));
        assert(!fs::exists(store.pathFor("oversized")));

        assert(store.keys().empty());
    }
    fs::remove_all(dir);

    std::cout << "[OK] FileBackingStore corrupt entries test\n";
}

int main() {
    try {
        testHashKeyIsDeterministic();
        testMemoryStore();
        testFileStoreLayout();
        testFileStoreCompression();
        testFileStoreBudget();
        testFileStoreCorruptEntries();
        std::cout << "All BackingStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "BackingStore test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
