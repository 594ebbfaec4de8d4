#include <iostream>
#include <memory>
#include <signal.h>
#include <chrono>
#include <thread>
#include <atomic>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include "ignition/common/Capabilities.hpp"
#include "ignition/config/ConfigLoader.hpp"
#include "ignition/scheduler/TaskScheduler.hpp"
#include "ignition/cache/ResourceCache.hpp"
#include "ignition/pool/ComponentPool.hpp"
#include "ignition/loader/PriorityLoader.hpp"

using namespace ignition;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::shared_ptr<scheduler::TaskScheduler> g_scheduler;
std::shared_ptr<cache::ResourceCache> g_cache;
std::shared_ptr<pool::ComponentPool> g_pool;
std::shared_ptr<loader::PriorityLoader> g_loader;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Рендерер-заглушка, переиспользуемый через пул
class Renderer : public Resettable, public Cleanable {
public:
    void draw(const std::string& frame) { frames_.push_back(frame); }
    size_t frames() const { return frames_.size(); }
    void reset() override { frames_.clear(); }
    void cleanup() override { spdlog::debug("Renderer: освобождён"); }
private:
    std::vector<std::string> frames_;
};

void simulateWork(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

// Initialize core components
void initializeComponents(const config::IgnitionConfig& cfg) {
    spdlog::info("Initializing core components...");
    try {
        spdlog::info("[init] TaskScheduler");
        g_scheduler = std::make_shared<scheduler::TaskScheduler>(cfg.scheduler);
        spdlog::info("[init] TaskScheduler initialized with {} workers", g_scheduler->workerCount());

        spdlog::info("[init] ResourceCache");
        g_cache = std::make_shared<cache::ResourceCache>(cfg.cache);
        spdlog::info("[init] ResourceCache initialized ({})", cfg.cache.storagePath);

        spdlog::info("[init] ComponentPool");
        g_pool = std::make_shared<pool::ComponentPool>();
        pool::PoolSettings renderers;
        renderers.kind = "renderer";
        renderers.maxSize = 4;
        config::applyPoolLimits(cfg, renderers);
        g_pool->registerTypedPool<Renderer>(renderers.kind, [] { return std::make_shared<Renderer>(); },
                                            renderers.maxSize, renderers.ttl);
        spdlog::info("[init] ComponentPool initialized");

        spdlog::info("[init] PriorityLoader");
        g_loader = std::make_shared<loader::PriorityLoader>(g_scheduler, g_cache, g_pool, cfg.loader);
        g_loader->addErrorCallback([](const std::string& name, std::exception_ptr error) {
            spdlog::warn("[demo] '{}' failed: {}", name, TaskFailedError::describe(error));
        });

        loader::ComponentConfig storage;
        storage.name = "cache";
        storage.priority = loader::Priority::Critical;
        storage.skeleton = [] { spdlog::info("[demo] skeleton: storage"); };
        storage.loader = [] {
            simulateWork(std::chrono::milliseconds(30));
            return std::any(std::string("storage ready"));
        };
        g_loader->registerComponent(storage);

        loader::ComponentConfig theme;
        theme.name = "theme";
        theme.priority = loader::Priority::Critical;
        theme.skeleton = [] { spdlog::info("[demo] skeleton: theme"); };
        theme.cacheKey = "component:theme";
        theme.loader = [] {
            simulateWork(std::chrono::milliseconds(20));
            return std::any(nlohmann::json{{"palette", "dark"}, {"accent", "#ff8800"}});
        };
        g_loader->registerComponent(theme);

        loader::ComponentConfig weather;
        weather.name = "weather";
        weather.priority = loader::Priority::High;
        weather.dependencies = {"cache"};
        weather.cacheKey = "component:weather";
        weather.preloadData = true;
        weather.preloader = [] { spdlog::info("[demo] preloading weather stations"); };
        weather.loader = [] {
            simulateWork(std::chrono::milliseconds(50));
            return std::any(nlohmann::json{{"city", "Moscow"}, {"tempC", -3}});
        };
        g_loader->registerComponent(weather);

        loader::ComponentConfig renderer;
        renderer.name = "renderer";
        renderer.priority = loader::Priority::Medium;
        renderer.dependencies = {"theme"};
        renderer.poolKind = "renderer";
        g_loader->registerComponent(renderer);

        loader::ComponentConfig analytics;
        analytics.name = "analytics";
        analytics.priority = loader::Priority::Deferred;
        analytics.loader = [] {
            simulateWork(std::chrono::milliseconds(10));
            return std::any(42);
        };
        g_loader->registerComponent(analytics);

        spdlog::info("[init] All components registered");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize components: {}", e.what());
        throw;
    }
}

// Прогрессивная загрузка и отчёт
void runStartup() {
    spdlog::info("Starting progressive load...");
    g_loader->start();

    if (auto instance = g_loader->getComponentAs<pool::Instance>("renderer")) {
        auto renderer = std::static_pointer_cast<Renderer>(*instance);
        renderer->draw("splash");
        spdlog::info("[demo] renderer frames: {}", renderer->frames());
    }

    if (g_running) {
        if (auto value = g_loader->loadOnDemand("analytics", std::chrono::milliseconds(1000))) {
            spdlog::info("[demo] analytics on demand: {}", std::any_cast<int>(*value));
        }
    }

    nlohmann::json report = {
        {"loader", g_loader->stats().toJson()},
        {"scheduler", g_scheduler->getMetrics().toJson()},
        {"cache", g_cache->getStats().toJson()},
        {"pools", g_pool->statsToJson()}
    };
    std::cout << report.dump(2) << std::endl;
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");
    try {
        if (g_loader) {
            g_loader->shutdown();
        }
        if (g_scheduler && !g_scheduler->shutdown()) {
            spdlog::warn("Scheduler workers did not finish within grace period");
        }
        if (g_cache) {
            g_cache->shutdown();
        }
        if (g_pool) {
            g_pool->shutdown();
        }
        spdlog::info("All components shut down successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        // Set up signal handlers
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        config::IgnitionConfig cfg;
        if (argc > 1) {
            cfg = config::loadConfigFile(argv[1]);
        }

        logging::initializeLogging(cfg.logging);
        spdlog::info("=== Ignition demo starting ===");

        initializeComponents(cfg);
        runStartup();
        shutdown();

        spdlog::info("=== Ignition demo shutdown complete ===");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        shutdown();
        return 1;
    }
}
