#include "ignition/graph/DependencyGraph.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <unordered_map>
#include <mutex>
#include <future>

namespace ignition {
namespace graph {

namespace {

using Clock = std::chrono::steady_clock;

// Узел арены
struct Node {
    std::string name;
    Factory factory;
    std::vector<std::string> dependencies;
    CleanupHook cleanup;
    NodeState state = NodeState::Registered;
    std::any value;
    std::shared_future<std::any> inflight;
    Clock::time_point lastAccess = Clock::now();
    std::optional<double> loadTimeMs;
};

enum class Mark { White, Gray, Black };

} // namespace

struct DependencyGraph::Impl {
    std::vector<std::unique_ptr<Node>> arena;
    std::unordered_map<std::string, size_t> index;
    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("graph");

    // Вызывается под mutex
    void visit(size_t node, std::vector<Mark>& marks, std::vector<std::string>& path,
               std::vector<std::string>& order) const {
        const auto& current = *arena[node];
        marks[node] = Mark::Gray;
        path.push_back(current.name);
        for (const auto& dep : current.dependencies) {
            auto it = index.find(dep);
            if (it == index.end()) {
                throw UnknownDependencyError(current.name, dep);
            }
            size_t next = it->second;
            if (marks[next] == Mark::Gray) {
                // Цикл: от первого вхождения dep в путь до текущего узла
                std::vector<std::string> cycle;
                bool inCycle = false;
                for (const auto& step : path) {
                    if (step == dep) inCycle = true;
                    if (inCycle) cycle.push_back(step);
                }
                cycle.push_back(dep);
                throw DependencyCycleError(std::move(cycle));
            }
            if (marks[next] == Mark::White) {
                visit(next, marks, path, order);
            }
        }
        path.pop_back();
        marks[node] = Mark::Black;
        order.push_back(current.name);
    }

    // Вызывается под mutex
    std::vector<std::string> orderFor(const std::vector<std::string>& roots) const {
        std::vector<Mark> marks(arena.size(), Mark::White);
        std::vector<std::string> order;
        std::vector<std::string> path;
        for (const auto& root : roots) {
            auto it = index.find(root);
            if (it == index.end()) {
                throw UnknownDependencyError("<root>", root);
            }
            if (marks[it->second] == Mark::White) {
                visit(it->second, marks, path, order);
            }
        }
        return order;
    }

    std::vector<std::string> allNames() const {
        std::vector<std::string> result;
        result.reserve(arena.size());
        for (const auto& node : arena) result.push_back(node->name);
        return result;
    }

    // Разрешение узла; граф, достижимый из него, уже проверен на циклы
    std::any resolveNode(size_t nodeIndex) {
        Node* node = nullptr;
        std::shared_ptr<std::promise<std::any>> promise;
        {
            std::unique_lock<std::mutex> lock(mutex);
            node = arena[nodeIndex].get();
            if (node->state == NodeState::Resolved) {
                node->lastAccess = Clock::now();
                return node->value;
            }
            if (node->state == NodeState::Resolving) {
                auto inflight = node->inflight;
                lock.unlock();
                logger->debug("Graph: '{}' уже разрешается, ожидаем", node->name);
                return inflight.get();
            }
            node->state = NodeState::Resolving;
            promise = std::make_shared<std::promise<std::any>>();
            node->inflight = promise->get_future().share();
        }

        try {
            for (const auto& dep : node->dependencies) {
                size_t depIndex = 0;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    depIndex = index.at(dep);
                }
                resolveNode(depIndex);
            }

            auto started = Clock::now();
            std::any value = node->factory();
            double elapsedMs = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

            {
                std::lock_guard<std::mutex> lock(mutex);
                node->value = value;
                node->state = NodeState::Resolved;
                node->lastAccess = Clock::now();
                node->loadTimeMs = elapsedMs;
                node->inflight = std::shared_future<std::any>();
            }
            promise->set_value(value);
            logger->info("Graph: '{}' разрешён за {:.2f} ms", node->name, elapsedMs);
            return value;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                node->state = NodeState::Registered;
                node->inflight = std::shared_future<std::any>();
            }
            promise->set_exception(std::current_exception());
            logger->error("Graph: не удалось разрешить '{}': {}", node->name,
                          TaskFailedError::describe(std::current_exception()));
            throw;
        }
    }

    // Снять мемоизированное значение; cleanup вызывается вне блокировки
    bool unloadNode(size_t nodeIndex) {
        std::any value;
        CleanupHook cleanup;
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& node = *arena[nodeIndex];
            if (node.state != NodeState::Resolved) {
                return false;
            }
            value = std::move(node.value);
            node.value.reset();
            node.state = NodeState::Registered;
            cleanup = node.cleanup;
            name = node.name;
        }
        if (cleanup) {
            try {
                cleanup(value);
            } catch (const std::exception& e) {
                logger->error("Graph: cleanup '{}' бросил исключение: {}", name, e.what());
            } catch (...) {
                logger->error("Graph: cleanup '{}' бросил неизвестное исключение", name);
            }
        }
        logger->debug("Graph: '{}' выгружен", name);
        return true;
    }
};

DependencyGraph::DependencyGraph() : pImpl(std::make_unique<Impl>()) {}

DependencyGraph::~DependencyGraph() = default;

NodeHandle DependencyGraph::registerNode(const std::string& name, Factory factory,
                                         std::vector<std::string> dependencies,
                                         CleanupHook cleanup) {
    if (name.empty()) {
        throw ConfigurationError("Пустое имя узла графа");
    }
    if (!factory) {
        throw ConfigurationError("Пустая фабрика для '" + name + "'");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->index.count(name) > 0) {
        throw DuplicateRegistrationError(name);
    }
    auto node = std::make_unique<Node>();
    node->name = name;
    node->factory = std::move(factory);
    node->dependencies = std::move(dependencies);
    node->cleanup = std::move(cleanup);

    NodeHandle handle{pImpl->arena.size(), name};
    pImpl->arena.push_back(std::move(node));
    pImpl->index.emplace(name, handle.index);
    pImpl->logger->debug("Graph: зарегистрирован '{}' ({} зависимостей)", name,
                         pImpl->arena.back()->dependencies.size());
    return handle;
}

std::any DependencyGraph::resolve(const std::string& name) {
    size_t nodeIndex = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->index.find(name);
        if (it == pImpl->index.end()) {
            throw UnknownDependencyError("<resolve>", name);
        }
        nodeIndex = it->second;
        pImpl->orderFor({name});
    }
    return pImpl->resolveNode(nodeIndex);
}

std::vector<std::string> DependencyGraph::preload(const std::optional<std::vector<std::string>>& names) {
    auto order = topologicalOrder(names);
    pImpl->logger->info("Graph: предзагрузка {} узлов", order.size());
    for (const auto& name : order) {
        resolve(name);
    }
    return order;
}

size_t DependencyGraph::unload(const std::optional<std::string>& name) {
    std::vector<size_t> targets;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (name) {
            auto it = pImpl->index.find(*name);
            if (it == pImpl->index.end()) {
                pImpl->logger->warn("Graph: unload неизвестного '{}'", *name);
                return 0;
            }
            targets.push_back(it->second);
        } else {
            for (size_t i = 0; i < pImpl->arena.size(); ++i) targets.push_back(i);
        }
    }
    size_t count = 0;
    // Обратный порядок регистрации: зависимые выгружаются раньше
    for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
        if (pImpl->unloadNode(*it)) ++count;
    }
    return count;
}

size_t DependencyGraph::unloadIdle(std::chrono::milliseconds maxIdle) {
    std::vector<size_t> idle;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto now = Clock::now();
        for (size_t i = 0; i < pImpl->arena.size(); ++i) {
            const auto& node = *pImpl->arena[i];
            if (node.state == NodeState::Resolved && now - node.lastAccess > maxIdle) {
                idle.push_back(i);
            }
        }
    }
    size_t count = 0;
    for (size_t nodeIndex : idle) {
        if (pImpl->unloadNode(nodeIndex)) ++count;
    }
    if (count > 0) {
        pImpl->logger->info("Graph: выгружено {} неиспользуемых узлов", count);
    }
    return count;
}

std::vector<std::string> DependencyGraph::topologicalOrder(const std::optional<std::vector<std::string>>& names) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->orderFor(names ? *names : pImpl->allNames());
}

void DependencyGraph::validate() const {
    topologicalOrder();
}

bool DependencyGraph::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->index.count(name) > 0;
}

bool DependencyGraph::isResolved(const std::string& name) const {
    auto current = state(name);
    return current && *current == NodeState::Resolved;
}

std::optional<NodeState> DependencyGraph::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->index.find(name);
    if (it == pImpl->index.end()) return std::nullopt;
    return pImpl->arena[it->second]->state;
}

std::vector<std::string> DependencyGraph::names() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->allNames();
}

std::vector<std::string> DependencyGraph::dependenciesOf(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->index.find(name);
    if (it == pImpl->index.end()) return {};
    return pImpl->arena[it->second]->dependencies;
}

GraphStats DependencyGraph::getStats() const {
    GraphStats stats;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    stats.total = pImpl->arena.size();
    size_t timed = 0;
    for (const auto& node : pImpl->arena) {
        if (node->state == NodeState::Resolved) ++stats.loaded;
        if (node->loadTimeMs) {
            stats.loadTimesMs[node->name] = *node->loadTimeMs;
            stats.totalLoadTimeMs += *node->loadTimeMs;
            ++timed;
        }
    }
    stats.averageLoadTimeMs = timed > 0 ? stats.totalLoadTimeMs / static_cast<double>(timed) : 0.0;
    return stats;
}

} // namespace graph
} // namespace ignition
