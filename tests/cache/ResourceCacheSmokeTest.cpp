#include <cassert>
#include <iostream>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <string>
#include "ignition/cache/ResourceCache.hpp"
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

CacheConfig memoryOnlyConfig() {
    CacheConfig config;
    config.enableDisk = false;
    config.sweepInterval = std::chrono::milliseconds(0);
    return config;
}

CacheConfig diskConfig(const fs::path& dir) {
    CacheConfig config;
    config.storagePath = dir.string();
    config.sweepInterval = std::chrono::milliseconds(0);
    return config;
}

} // namespace

void testSetGetAndMetrics() {
    std::cout << "Testing ResourceCache set/get...\n";

    ResourceCache cache(memoryOnlyConfig());
    cache.set("theme", {{"palette", "dark"}});
    auto value = cache.get("theme");
    assert(value);
    assert((*value)["palette"] == "dark");
    assert(!cache.get("missing"));

    auto stats = cache.getStats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.hitRate == 0.5);
    assert(stats.memoryEntries == 1);
    assert(stats.diskEntries == 0);
    assert(stats.toJson()["hits"] == 1);

    assert(cache.remove("theme"));
    assert(!cache.remove("theme"));
    assert(!cache.get("theme"));

    std::cout << "[OK] ResourceCache set/get test\n";
}

void testTtlExpiryAndRecompute() {
    std::cout << "Testing ResourceCache TTL...\n";

    ResourceCache cache(memoryOnlyConfig());
    std::atomic<int> computeCalls{0};
    auto compute = [&]() -> nlohmann::json { return ++computeCalls; };

    assert(cache.getOrCompute("weather", compute, std::chrono::milliseconds(50)) == 1);
    assert(cache.getOrCompute("weather", compute, std::chrono::milliseconds(50)) == 1);
    assert(computeCalls == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(!cache.get("weather"));
    assert(cache.getOrCompute("weather", compute, std::chrono::milliseconds(50)) == 2);
    assert(computeCalls == 2);

    // forceRefresh вычисляет заново даже при живой записи
    assert(cache.getOrCompute("weather", compute, std::nullopt, true) == 3);
    assert(cache.getStats().computeCount == 3);

    std::cout << "[OK] ResourceCache TTL test\n";
}

void testClearExpired() {
    std::cout << "Testing ResourceCache clearExpired...\n";

    auto store = std::make_shared<MemoryBackingStore>();
    ResourceCache cache(memoryOnlyConfig(), store);
    cache.set("short", 1, std::chrono::milliseconds(20));
    cache.set("long", 2, std::chrono::seconds(10));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    assert(cache.clearExpired() >= 1);
    auto remaining = cache.get("long");
    assert(remaining && *remaining == 2);
    assert(store->keys().size() == 1);
    assert(cache.getStats().memoryEntries == 1);

    std::cout << "[OK] ResourceCache clearExpired test\n";
}

void testComputeStampede() {
    std::cout << "Testing ResourceCache stampede protection...\n";

    ResourceCache cache(memoryOnlyConfig());
    std::atomic<int> computeCalls{0};
    std::vector<std::thread> threads;
    std::atomic<int> correct{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto value = cache.getOrCompute("catalog", [&]() -> nlohmann::json {
                computeCalls++;
                std::this_thread::sleep_for(std::chrono::milliseconds(60));
                return {{"items", 128}};
            });
            if (value["items"] == 128) correct++;
        });
    }
    for (auto& thread : threads) thread.join();

    assert(computeCalls == 1);
    assert(correct == 8);

    std::cout << "[OK] ResourceCache stampede test\n";
}

void testComputeFailure() {
    std::cout << "Testing ResourceCache compute failure...\n";

    ResourceCache cache(memoryOnlyConfig());
    bool thrown = false;
    try {
        cache.getOrCompute("broken", []() -> nlohmann::json { throw std::runtime_error("backend down"); });
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "backend down";
    }
    assert(thrown);
    // Ошибка не кэшируется, следующий вызов вычисляет заново
    assert(!cache.get("broken"));
    assert(cache.getOrCompute("broken", []() -> nlohmann::json { return "ok"; }) == "ok");

    std::cout << "[OK] ResourceCache compute failure test\n";
}

void testDiskPromotionAndHashNaming() {
    std::cout << "Testing ResourceCache disk tier...\n";

    auto dir = scratchDirectory("cache_disk");
    {
        ResourceCache writer(diskConfig(dir));
        writer.set("user:42", {{"name", "Ada"}});
        auto expected = dir / (hashKey("user:42") + ".cache");
        assert(fs::exists(expected));

        auto stored = nlohmann::json::parse(std::ifstream(expected));
        assert(stored["key"] == "user:42");
        assert(stored["value"]["name"] == "Ada");
        assert(stored.contains("createdAt"));
        assert(stored.contains("ttlMs"));
    }
    {
        // Новый экземпляр: память пуста, запись поднимается с диска
        ResourceCache reader(diskConfig(dir));
        assert(reader.getStats().memoryEntries == 0);
        auto value = reader.get("user:42");
        assert(value);
        assert((*value)["name"] == "Ada");
        auto stats = reader.getStats();
        assert(stats.memoryEntries == 1);
        assert(stats.diskEntries == 1);
        assert(stats.hits == 1);
    }
    fs::remove_all(dir);

    std::cout << "[OK] ResourceCache disk tier test\n";
}

void testCorruptDiskEntry() {
    std::cout << "Testing ResourceCache corrupt disk entry...\n";

    auto dir = scratchDirectory("cache_corrupt");
    {
        ResourceCache cache(diskConfig(dir));
        auto path = dir / (hashKey("bad") + ".cache");
        std::ofstream(path) << "{not json";
        assert(!cache.get("bad"));
        assert(!fs::exists(path));
        assert(cache.getStats().misses == 1);
    }
    fs::remove_all(dir);

    std::cout << "[OK] ResourceCache corrupt entry test\n";
}

void testClearPattern() {
    std::cout << "Testing ResourceCache clearPattern...\n";

    auto dir = scratchDirectory("cache_pattern");
    {
        ResourceCache cache(diskConfig(dir));
        cache.set("user:1", 1);
        cache.set("user:2", 2);
        cache.set("theme:dark", 3);

        assert(cache.clearPattern("user:*") == 2);
        assert(!cache.get("user:1"));
        assert(!cache.get("user:2"));
        assert(cache.get("theme:dark"));
        assert(cache.getStats().diskEntries == 1);

        cache.clear();
        assert(cache.getStats().memoryEntries == 0);
        assert(cache.getStats().diskEntries == 0);
    }
    fs::remove_all(dir);

    std::cout << "[OK] ResourceCache clearPattern test\n";
}

void testMemoryEviction() {
    std::cout << "Testing ResourceCache memory eviction...\n";

    auto config = memoryOnlyConfig();
    config.maxMemoryEntries = 4;
    ResourceCache cache(config);
    for (int i = 0; i < 4; ++i) cache.set("k" + std::to_string(i), i);
    // Часто используемые записи переживают вытеснение
    for (int i = 1; i < 4; ++i) cache.get("k" + std::to_string(i));
    cache.set("k4", 4);

    auto stats = cache.getStats();
    assert(stats.memoryEntries == 4);
    assert(stats.evictions == 1);
    assert(!cache.get("k0"));
    assert(cache.get("k4"));

    std::cout << "[OK] ResourceCache memory eviction test\n";
}

void testCompressedDiskEntries() {
    std::cout << "Testing ResourceCache compression...\n";

    auto dir = scratchDirectory("cache_z");
    {
        auto config = diskConfig(dir);
        config.enableCompression = true;
        config.compressThreshold = 128;
        ResourceCache writer(config);
        nlohmann::json big = nlohmann::json::array();
        for (int i = 0; i < 200; ++i) big.push_back("entry");
        writer.set("big", big);

        auto path = dir / (hashKey("big") + ".cache");
        assert(fs::file_size(path) < big.dump().size());

        ResourceCache reader(config);
        auto value = reader.get("big");
        assert(value);
        assert(value->size() == 200);
    }
    fs::remove_all(dir);

    std::cout << "[OK] ResourceCache compression test\n";
}

void testConfigValidation() {
    std::cout << "Testing CacheConfig...\n";

    CacheConfig config;
    assert(config.validate());
    config.maxMemoryEntries = 0;
    assert(!config.validate());

    auto parsed = CacheConfig::fromJson({{"defaultTtlMs", 500}, {"enableDisk", false}});
    assert(parsed.defaultTtl == std::chrono::milliseconds(500));
    assert(!parsed.enableDisk);
    assert(parsed.maxMemoryEntries == 100);
    assert(parsed.toJson()["defaultTtlMs"] == 500);

    std::cout << "[OK] CacheConfig test\n";
}

int main() {
    try {
        testSetGetAndMetrics();
        testTtlExpiryAndRecompute();
        testClearExpired();
        testComputeStampede();
        testComputeFailure();
        testDiskPromotionAndHashNaming();
        testCorruptDiskEntry();
        testClearPattern();
        testMemoryEviction();
        testCompressedDiskEntries();
        testConfigValidation();
        std::cout << "All ResourceCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ResourceCache test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
