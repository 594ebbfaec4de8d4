#include <cassert>
#include <iostream>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <string>
#include <algorithm>
#include "ignition/graph/DependencyGraph.hpp"
#include "ignition/common/Errors.hpp"

using namespace ignition;
using namespace ignition::graph;

namespace {

size_t positionOf(const std::vector<std::string>& order, const std::string& name) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

class Connection : public Cleanable {
public:
    explicit Connection(std::atomic<int>& closed) : closed_(closed) {}
    void cleanup() override { closed_++; }
private:
    std::atomic<int>& closed_;
};

} // namespace

void testResolveOrderAndMemoization() {
    std::cout << "Testing DependencyGraph resolve order...\n";

    DependencyGraph graph;
    std::mutex mutex;
    std::vector<std::string> calls;
    auto record = [&](const std::string& name, int value) {
        return [&, name, value]() -> std::any {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(name);
            return value;
        };
    };
    graph.registerNode("config", record("config", 1));
    graph.registerNode("db", record("db", 2), {"config"});
    graph.registerNode("api", record("api", 3), {"db", "config"});

    assert(std::any_cast<int>(graph.resolve("api")) == 3);
    assert((calls == std::vector<std::string>{"config", "db", "api"}));
    assert(graph.isResolved("db"));

    // Повторное разрешение берёт мемоизированное значение
    assert(std::any_cast<int>(graph.resolve("api")) == 3);
    assert(calls.size() == 3);

    auto stats = graph.getStats();
    assert(stats.total == 3);
    assert(stats.loaded == 3);
    assert(stats.loadTimesMs.size() == 3);
    assert(stats.toJson()["loaded"] == 3);

    std::cout << "[OK] DependencyGraph resolve order test\n";
}

void testSingleFlightResolve() {
    std::cout << "Testing DependencyGraph single-flight...\n";

    DependencyGraph graph;
    std::atomic<int> factoryCalls{0};
    graph.registerNode("slow", [&]() -> std::any {
        factoryCalls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::string("ready");
    });

    std::vector<std::thread> threads;
    std::atomic<int> matches{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (std::any_cast<std::string>(graph.resolve("slow")) == "ready") matches++;
        });
    }
    for (auto& thread : threads) thread.join();

    assert(factoryCalls == 1);
    assert(matches == 8);

    std::cout << "[OK] DependencyGraph single-flight test\n";
}

void testCycleDetection() {
    std::cout << "Testing DependencyGraph cycle detection...\n";

    DependencyGraph graph;
    std::atomic<int> factoryCalls{0};
    auto factory = [&]() -> std::any { factoryCalls++; return std::any(); };
    graph.registerNode("a", factory, {"b"});
    graph.registerNode("b", factory, {"c"});
    graph.registerNode("c", factory, {"a"});
    graph.registerNode("free", factory);

    bool detected = false;
    try {
        graph.resolve("a");
    } catch (const DependencyCycleError& e) {
        detected = true;
        const auto& cycle = e.cycle();
        assert(cycle.size() == 4);
        assert(cycle.front() == cycle.back());
        assert(std::string(e.what()).find("a -> b -> c -> a") != std::string::npos);
    }
    assert(detected);
    assert(factoryCalls == 0);

    bool validateThrows = false;
    try {
        graph.validate();
    } catch (const DependencyCycleError&) {
        validateThrows = true;
    }
    assert(validateThrows);

    // Узел вне цикла по-прежнему разрешается
    graph.resolve("free");
    assert(factoryCalls == 1);

    std::cout << "[OK] DependencyGraph cycle detection test\n";
}

void testUnknownAndDuplicate() {
    std::cout << "Testing DependencyGraph registration errors...\n";

    DependencyGraph graph;
    graph.registerNode("ui", []() -> std::any { return 1; }, {"theme"});

    bool unknown = false;
    try {
        graph.resolve("ui");
    } catch (const UnknownDependencyError& e) {
        unknown = true;
        assert(e.owner() == "ui");
        assert(e.dependency() == "theme");
    }
    assert(unknown);

    bool duplicate = false;
    try {
        graph.registerNode("ui", []() -> std::any { return 2; });
    } catch (const DuplicateRegistrationError& e) {
        duplicate = true;
        assert(e.name() == "ui");
    }
    assert(duplicate);

    bool emptyFactory = false;
    try {
        graph.registerNode("bad", nullptr);
    } catch (const ConfigurationError&) {
        emptyFactory = true;
    }
    assert(emptyFactory);

    std::cout << "[OK] DependencyGraph registration errors test\n";
}

void testFactoryFailureAllowsRetry() {
    std::cout << "Testing DependencyGraph factory failure...\n";

    DependencyGraph graph;
    std::atomic<int> attempts{0};
    graph.registerNode("flaky", [&]() -> std::any {
        if (++attempts == 1) throw std::runtime_error("first attempt fails");
        return 5;
    });
    graph.registerNode("consumer", []() -> std::any { return 6; }, {"flaky"});

    bool failed = false;
    try {
        graph.resolve("consumer");
    } catch (const std::runtime_error& e) {
        failed = std::string(e.what()) == "first attempt fails";
    }
    assert(failed);
    assert(graph.state("flaky") == NodeState::Registered);
    assert(graph.state("consumer") == NodeState::Registered);

    assert(std::any_cast<int>(graph.resolve("consumer")) == 6);
    assert(attempts == 2);

    std::cout << "[OK] DependencyGraph factory failure test\n";
}

void testPreloadAndUnload() {
    std::cout << "Testing DependencyGraph preload/unload...\n";

    DependencyGraph graph;
    std::atomic<int> closed{0};
    graph.registerTyped<Connection>("conn", [&]() { return std::make_shared<Connection>(closed); });
    graph.registerNode("cache", []() -> std::any { return 1; }, {"conn"});
    graph.registerNode("ui", []() -> std::any { return 2; }, {"cache"});
    graph.registerNode("metrics", []() -> std::any { return 3; });

    auto order = graph.topologicalOrder();
    assert(order.size() == 4);
    assert(positionOf(order, "conn") < positionOf(order, "cache"));
    assert(positionOf(order, "cache") < positionOf(order, "ui"));

    auto loaded = graph.preload(std::vector<std::string>{"ui"});
    assert((loaded == std::vector<std::string>{"conn", "cache", "ui"}));
    assert(!graph.isResolved("metrics"));
    assert(graph.resolveAs<Connection>("conn") != nullptr);
    assert((graph.dependenciesOf("ui") == std::vector<std::string>{"cache"}));

    assert(graph.unload(std::string("conn")) == 1);
    assert(closed == 1);
    assert(!graph.isResolved("conn"));
    assert(graph.unload(std::string("conn")) == 0);

    graph.preload();
    assert(graph.getStats().loaded == 4);
    assert(graph.unload() == 4);
    assert(closed == 2);
    assert(graph.getStats().loaded == 0);

    std::cout << "[OK] DependencyGraph preload/unload test\n";
}

void testUnloadIdle() {
    std::cout << "Testing DependencyGraph idle unload...\n";

    DependencyGraph graph;
    graph.registerNode("old", []() -> std::any { return 1; });
    graph.registerNode("fresh", []() -> std::any { return 2; });
    graph.resolve("old");
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    graph.resolve("fresh");

    assert(graph.unloadIdle(std::chrono::milliseconds(30)) == 1);
    assert(!graph.isResolved("old"));
    assert(graph.isResolved("fresh"));
    assert((graph.names() == std::vector<std::string>{"old", "fresh"}));

    std::cout << "[OK] DependencyGraph idle unload test\n";
}

int main() {
    try {
        testResolveOrderAndMemoization();
        testSingleFlightResolve();
        testCycleDetection();
        testUnknownAndDuplicate();
        testFactoryFailureAllowsRetry();
        testPreloadAndUnload();
        testUnloadIdle();
        std::cout << "All DependencyGraph tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "DependencyGraph test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
