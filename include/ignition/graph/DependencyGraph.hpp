#pragma once

#include <any>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "ignition/common/Capabilities.hpp"

namespace ignition {
namespace graph {

using Factory = std::function<std::any()>;
using CleanupHook = std::function<void(std::any&)>;

// Состояние узла: Registered -> Resolving -> Resolved -> (unload) -> Registered
enum class NodeState {
    Registered,
    Resolving,
    Resolved
};

inline const char* toString(NodeState state) {
    switch (state) {
        case NodeState::Registered: return "registered";
        case NodeState::Resolving: return "resolving";
        case NodeState::Resolved: return "resolved";
    }
    return "unknown";
}

// Дескриптор зарегистрированного узла (индекс в арене)
struct NodeHandle {
    size_t index = 0;
    std::string name;
};

// GraphStats: статистика разрешения узлов
struct GraphStats {
    size_t total = 0;                           // Зарегистрировано
    size_t loaded = 0;                          // Разрешено сейчас
    double totalLoadTimeMs = 0.0;               // Суммарное время фабрик
    double averageLoadTimeMs = 0.0;             // Среднее время фабрик
    std::map<std::string, double> loadTimesMs;  // Время последнего разрешения
    nlohmann::json toJson() const {
        return {
            {"total", total},
            {"loaded", loaded},
            {"totalLoadTimeMs", totalLoadTimeMs},
            {"averageLoadTimeMs", averageLoadTimeMs},
            {"loadTimesMs", loadTimesMs}
        };
    }
};

// DependencyGraph: ленивое, мемоизированное разрешение именованных узлов
// с зависимостями. Фабрика каждого узла выполняется не более одного раза
// одновременно; конкурентные вызовы resolve ждут результата первого вызова.
// Циклы и неизвестные зависимости обнаруживаются до запуска фабрик
class DependencyGraph {
public:
    DependencyGraph(); // Конструктор
    ~DependencyGraph(); // Деструктор
    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // Зарегистрировать узел. DuplicateRegistrationError для существующего имени
    NodeHandle registerNode(const std::string& name, Factory factory,
                            std::vector<std::string> dependencies = {},
                            CleanupHook cleanup = nullptr);

    // Типизированная регистрация: Cleanable подключается один раз здесь
    template<typename T>
    NodeHandle registerTyped(const std::string& name,
                             std::function<std::shared_ptr<T>()> factory,
                             std::vector<std::string> dependencies = {}) {
        CleanupHook cleanup;
        if constexpr (std::is_base_of_v<Cleanable, T>) {
            cleanup = [](std::any& value) {
                auto instance = std::any_cast<std::shared_ptr<T>>(value);
                if (instance) instance->cleanup();
            };
        }
        return registerNode(name, [factory = std::move(factory)]() -> std::any { return factory(); },
                            std::move(dependencies), std::move(cleanup));
    }

    // Разрешить узел (сначала рекурсивно его зависимости)
    std::any resolve(const std::string& name);

    template<typename T>
    std::shared_ptr<T> resolveAs(const std::string& name) {
        return std::any_cast<std::shared_ptr<T>>(resolve(name));
    }

    // Разрешить names (или все узлы) в топологическом порядке; возвращает порядок
    std::vector<std::string> preload(const std::optional<std::vector<std::string>>& names = std::nullopt);
    // Выгрузить узел (или все); возвращает кол-во выгруженных
    size_t unload(const std::optional<std::string>& name = std::nullopt);
    // Выгрузить узлы, к которым не обращались дольше maxIdle
    size_t unloadIdle(std::chrono::milliseconds maxIdle);

    // Топологический порядок (зависимости раньше зависимых)
    std::vector<std::string> topologicalOrder(const std::optional<std::vector<std::string>>& names = std::nullopt) const;
    void validate() const; // Проверить весь граф на циклы и неизвестные зависимости

    bool contains(const std::string& name) const;
    bool isResolved(const std::string& name) const;
    std::optional<NodeState> state(const std::string& name) const;
    std::vector<std::string> names() const; // В порядке регистрации
    std::vector<std::string> dependenciesOf(const std::string& name) const;
    GraphStats getStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace graph
} // namespace ignition
