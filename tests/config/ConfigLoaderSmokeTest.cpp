#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include "ignition/config/ConfigLoader.hpp"
#include "ignition/common/Errors.hpp"

using namespace ignition;
namespace fs = std::filesystem;

namespace {

fs::path writeFile(const std::string& name, const std::string& content) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = fs::temp_directory_path() / ("ignition_" + name + "_" + std::to_string(stamp) + ".json");
    std::ofstream(path) << content;
    return path;
}

} // namespace

void testDefaultsWhenEmpty() {
    std::cout << "Testing config defaults...\n";

    auto config = config::IgnitionConfig::fromJson(nlohmann::json::object());
    assert(config.validate());
    assert(config.scheduler.pool.threadCount == 4);
    assert(config.cache.maxMemoryEntries == 100);
    assert(config.loader.interactiveBudget == std::chrono::milliseconds(2000));
    assert(config.pools.empty());

    std::cout << "[OK] Config defaults test\n";
}

void testLoadConfigFile() {
    std::cout << "Testing loadConfigFile...\n";

    auto path = writeFile("config", R"({
        "logging": {"level": "warn"},
        "scheduler": {"pool": {"threadCount": 8}, "shutdownGraceMs": 250},
        "cache": {"maxMemoryEntries": 10, "enableDisk": false, "defaultTtlMs": 1000},
        "loader": {"interactiveBudgetMs": 500, "componentTimeoutMs": 100, "sweepDeferred": false},
        "pools": [{"kind": "renderer", "maxSize": 3, "ttlMs": 2000}]
    })");
    auto config = config::loadConfigFile(path.string());
    fs::remove(path);

    assert(config.logging.level == spdlog::level::warn);
    assert(config.scheduler.pool.threadCount == 8);
    assert(config.scheduler.shutdownGrace == std::chrono::milliseconds(250));
    assert(config.cache.maxMemoryEntries == 10);
    assert(!config.cache.enableDisk);
    assert(config.cache.storagePath == "./cache");
    assert(config.loader.interactiveBudget == std::chrono::milliseconds(500));
    assert(config.loader.componentTimeout == std::chrono::milliseconds(100));
    assert(!config.loader.sweepDeferred);
    assert(config.pools.size() == 1);

    pool::PoolSettings renderer;
    renderer.kind = "renderer";
    config::applyPoolLimits(config, renderer);
    assert(renderer.maxSize == 3);
    assert(renderer.ttl == std::chrono::milliseconds(2000));

    pool::PoolSettings other;
    other.kind = "other";
    config::applyPoolLimits(config, other);
    assert(other.maxSize == 50);

    // Сериализация и повторный разбор дают ту же конфигурацию
    auto reparsed = config::IgnitionConfig::fromJson(config.toJson());
    assert(reparsed.toJson() == config.toJson());

    std::cout << "[OK] loadConfigFile test\n";
}

void testInvalidConfigs() {
    std::cout << "Testing invalid configs...\n";

    bool missing = false;
    try {
        config::loadConfigFile("/nonexistent/ignition.json");
    } catch (const ConfigurationError&) {
        missing = true;
    }
    assert(missing);

    auto broken = writeFile("broken", "{ \"cache\": ");
    bool unparsable = false;
    try {
        config::loadConfigFile(broken.string());
    } catch (const ConfigurationError&) {
        unparsable = true;
    }
    fs::remove(broken);
    assert(unparsable);

    bool zeroThreads = false;
    try {
        config::IgnitionConfig::fromJson({{"scheduler", {{"pool", {{"threadCount", 0}}}}}});
    } catch (const ConfigurationError&) {
        zeroThreads = true;
    }
    assert(zeroThreads);

    bool wrongType = false;
    try {
        config::IgnitionConfig::fromJson({{"cache", {{"maxMemoryEntries", "many"}}}});
    } catch (const ConfigurationError&) {
        wrongType = true;
    }
    assert(wrongType);

    bool notObject = false;
    try {
        config::IgnitionConfig::fromJson(nlohmann::json::array());
    } catch (const ConfigurationError&) {
        notObject = true;
    }
    assert(notObject);

    std::cout << "[OK] Invalid configs test\n";
}

int main() {
    try {
        testDefaultsWhenEmpty();
        testLoadConfigFile();
        testInvalidConfigs();
        std::cout << "All ConfigLoader tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ConfigLoader test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
