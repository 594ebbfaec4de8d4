#pragma once

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ignition/loader/ComponentTypes.hpp"
#include "ignition/scheduler/TaskScheduler.hpp"
#include "ignition/cache/ResourceCache.hpp"
#include "ignition/pool/ComponentPool.hpp"

namespace ignition {
namespace loader {

// PriorityLoader: прогрессивная загрузка компонентов по уровням приоритета.
// Уровень обходится целиком (scatter/gather) до перехода к следующему;
// порядок зависимостей обеспечивает DependencyGraph. Отказ компонента
// не прерывает загрузку, но его зависимые пропускаются.
// Планировщик, кэш и пул внедряются вызывающим кодом; кэш и пул необязательны
class PriorityLoader {
public:
    PriorityLoader(std::shared_ptr<scheduler::TaskScheduler> scheduler,
                   std::shared_ptr<cache::ResourceCache> cache = nullptr,
                   std::shared_ptr<pool::ComponentPool> pool = nullptr,
                   const LoaderConfig& config = LoaderConfig{}); // Конструктор
    ~PriorityLoader(); // Деструктор
    PriorityLoader(const PriorityLoader&) = delete;
    PriorityLoader& operator=(const PriorityLoader&) = delete;

    // ConfigurationError: дубликат имени, зависимость на более поздний уровень
    void registerComponent(ComponentConfig config);

    // Проверить регистрацию и обойти все уровни. Возвращается, когда каждый уровень обработан
    void start();

    std::optional<std::any> getComponent(const std::string& name) const; // Пусто для неудачных/невыгруженных

    template<typename T>
    std::optional<T> getComponentAs(const std::string& name) const {
        auto value = getComponent(name);
        if (!value) return std::nullopt;
        if (const T* typed = std::any_cast<T>(&*value)) return *typed;
        return std::nullopt;
    }

    // Загрузить компонент вне обхода уровней (вместе с зависимостями).
    // nullopt при ошибке загрузки, TaskTimeoutError по таймауту
    std::optional<std::any> loadOnDemand(const std::string& name,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    LoaderStats stats() const; // Статистика

    void addProgressCallback(ProgressCallback callback);
    void addCompletionCallback(CompletionCallback callback);
    void addErrorCallback(ErrorCallback callback);

    bool isLoaded(const std::string& name) const;
    std::vector<std::string> failedComponents() const;
    std::vector<std::string> registeredComponents() const;
    bool unloadComponent(const std::string& name); // Выгрузить (экземпляр пула возвращается в пул)

    // Остановить обход, отменить ожидающие загрузки, вернуть экземпляры в пул
    void shutdown();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Реализация, разделяется с задачами загрузки
};

} // namespace loader
} // namespace ignition
