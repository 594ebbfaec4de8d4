#include "ignition/loader/PriorityLoader.hpp"
#include "ignition/graph/DependencyGraph.hpp"
#include "ignition/common/Errors.hpp"
#include "ignition/common/Logging.hpp"
#include <map>
#include <set>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <algorithm>

namespace ignition {
namespace loader {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point from, Clock::time_point to = Clock::now()) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

struct PriorityLoader::Impl : std::enable_shared_from_this<PriorityLoader::Impl> {
    LoaderConfig config;
    std::shared_ptr<scheduler::TaskScheduler> scheduler;
    std::shared_ptr<cache::ResourceCache> cache;
    std::shared_ptr<pool::ComponentPool> pool;
    graph::DependencyGraph graph;

    std::map<std::string, ComponentConfig> components;
    std::vector<std::string> registrationOrder;
    std::unordered_map<std::string, std::any> values;
    std::set<std::string> loading;
    std::map<std::string, std::exception_ptr> failed;
    std::map<std::string, double> durations;
    std::set<std::string> skeletonsShown;
    std::unordered_map<std::string, pool::Instance> pooled;
    std::vector<scheduler::TaskId> inflight;
    std::vector<scheduler::TaskId> skeletonTasks;
    std::optional<Clock::time_point> startTime;
    std::optional<Clock::time_point> endTime;
    std::optional<double> skeletonShownMs;
    std::optional<double> interactiveMs;

    std::vector<ProgressCallback> progressCallbacks;
    std::vector<CompletionCallback> completionCallbacks;
    std::vector<ErrorCallback> errorCallbacks;

    mutable std::mutex mutex;
    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("loader");

    Impl(std::shared_ptr<scheduler::TaskScheduler> sched, std::shared_ptr<cache::ResourceCache> resourceCache,
         std::shared_ptr<pool::ComponentPool> componentPool, const LoaderConfig& cfg)
        : config(cfg), scheduler(std::move(sched)), cache(std::move(resourceCache)), pool(std::move(componentPool)) {}

    // --- callbacks (вызываются вне блокировки) ---

    void emitProgress(const std::string& name, double fraction) {
        std::vector<ProgressCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callbacks = progressCallbacks;
        }
        logger->debug("Loader: '{}' {:.0f}%", name, fraction * 100.0);
        for (const auto& callback : callbacks) {
            try {
                callback(name, fraction);
            } catch (const std::exception& e) {
                logger->error("Loader: callback прогресса для '{}' бросил исключение: {}", name, e.what());
            } catch (...) {
                logger->error("Loader: callback прогресса для '{}' бросил неизвестное исключение", name);
            }
        }
    }

    void emitCompletion(const std::string& name, const std::any& value) {
        std::vector<CompletionCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callbacks = completionCallbacks;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(name, value);
            } catch (const std::exception& e) {
                logger->error("Loader: callback завершения для '{}' бросил исключение: {}", name, e.what());
            } catch (...) {
                logger->error("Loader: callback завершения для '{}' бросил неизвестное исключение", name);
            }
        }
    }

    void emitError(const std::string& name, std::exception_ptr error) {
        std::vector<ErrorCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callbacks = errorCallbacks;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(name, error);
            } catch (const std::exception& e) {
                logger->error("Loader: callback ошибки для '{}' бросил исключение: {}", name, e.what());
            } catch (...) {
                logger->error("Loader: callback ошибки для '{}' бросил неизвестное исключение", name);
            }
        }
    }

    // Записать отказ, если компонент не загружен и отказ ещё не записан
    void markFailed(const std::string& name, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (values.count(name) > 0 || failed.count(name) > 0) return;
            failed[name] = error;
        }
        emitError(name, error);
    }

    // Явный повтор: снять отказы компонента и всех его зависимостей
    void forgetFailures(const std::string& name) {
        auto closure = graph.topologicalOrder(std::vector<std::string>{name});
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& member : closure) {
            failed.erase(member);
        }
    }

    // --- загрузка компонента (фабрика узла графа; зависимости уже разрешены) ---

    const ComponentConfig& componentFor(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        return components.at(name);
    }

    std::optional<std::any> decodeCached(const ComponentConfig& component, const nlohmann::json& cached) {
        if (!component.codec) {
            return std::any(cached);
        }
        try {
            return component.codec->decode(cached);
        } catch (const std::exception& e) {
            logger->warn("Loader: не удалось декодировать кэш '{}': {}", component.name, e.what());
            return std::nullopt;
        }
    }

    void storeInCache(const ComponentConfig& component, const std::any& value) {
        nlohmann::json encoded;
        try {
            if (component.codec) {
                encoded = component.codec->encode(value);
            } else if (const auto* json = std::any_cast<nlohmann::json>(&value)) {
                encoded = *json;
            } else {
                logger->warn("Loader: '{}' не JSON и без кодека, результат не кэшируется", component.name);
                return;
            }
        } catch (const std::exception& e) {
            logger->warn("Loader: не удалось закодировать '{}' для кэша: {}", component.name, e.what());
            return;
        }
        cache->set(*component.cacheKey, encoded, config.cacheTtl);
    }

    std::any produce(const ComponentConfig& component) {
        if (!component.poolKind) {
            return component.loader();
        }
        auto instance = pool->acquire(*component.poolKind);
        if (!instance) {
            throw IgnitionError("Пул '" + *component.poolKind + "' не выдал экземпляр для '" + component.name + "'");
        }
        std::lock_guard<std::mutex> lock(mutex);
        pooled[component.name] = instance;
        return std::any(instance);
    }

    std::any loadComponent(const std::string& name) {
        const ComponentConfig& component = componentFor(name);
        std::exception_ptr recorded;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = failed.find(name);
            if (it != failed.end()) {
                recorded = it->second;
            } else {
                loading.insert(name);
            }
        }
        // Записанный отказ не повторяется автоматически; повтор только через loadOnDemand
        if (recorded) {
            logger->debug("Loader: '{}' уже не загрузился, повтор не выполняется", name);
            std::rethrow_exception(recorded);
        }
        auto started = Clock::now();
        emitProgress(name, 0.1);

        try {
            std::any value;
            bool fromCache = false;
            bool cacheable = component.cacheKey && cache && !component.poolKind;
            if (cacheable) {
                if (auto cached = cache->get(*component.cacheKey)) {
                    if (auto decoded = decodeCached(component, *cached)) {
                        value = std::move(*decoded);
                        fromCache = true;
                        logger->debug("Loader: '{}' взят из кэша", name);
                    }
                }
            }
            if (!fromCache) {
                if (component.preloadData && component.preloader) {
                    component.preloader();
                }
                emitProgress(name, 0.3);
                value = produce(component);
                emitProgress(name, 0.8);
                if (cacheable) {
                    storeInCache(component, value);
                }
            }

            double duration = elapsedMs(started);
            {
                std::lock_guard<std::mutex> lock(mutex);
                loading.erase(name);
                values[name] = value;
                durations[name] = duration;
                failed.erase(name);
            }
            emitProgress(name, 1.0);
            emitCompletion(name, value);
            logger->info("Loader: '{}' загружен за {:.2f} ms{}", name, duration, fromCache ? " (кэш)" : "");
            return value;
        } catch (...) {
            auto error = std::current_exception();
            {
                std::lock_guard<std::mutex> lock(mutex);
                loading.erase(name);
                failed[name] = error;
            }
            logger->error("Loader: '{}' не загружен: {}", name, TaskFailedError::describe(error));
            emitError(name, error);
            throw;
        }
    }

    // --- обход уровней ---

    void validateRegistration() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [name, component] : components) {
                for (const auto& dep : component.dependencies) {
                    auto it = components.find(dep);
                    if (it == components.end()) {
                        throw ConfigurationError("Компонент '" + name + "' зависит от незарегистрированного '" + dep + "'");
                    }
                    if (it->second.priority > component.priority) {
                        throw ConfigurationError("Компонент '" + name + "' (" + toString(component.priority) +
                                                 ") зависит от '" + dep + "' более позднего уровня (" +
                                                 toString(it->second.priority) + ")");
                    }
                }
            }
        }
        graph.validate();
    }

    std::vector<std::string> tierMembers(Priority priority) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> members;
        for (const auto& name : registrationOrder) {
            if (components.at(name).priority == priority) members.push_back(name);
        }
        return members;
    }

    // Дождаться задачи уровня; исход уже записан фабрикой либо записывается здесь
    void awaitTask(const std::string& name, const scheduler::TaskId& id,
                   std::optional<Clock::time_point> deadline) {
        try {
            if (deadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
                scheduler->await(id, std::max(remaining, std::chrono::milliseconds(0)));
            } else {
                scheduler->await(id);
            }
        } catch (const TaskTimeoutError& e) {
            logger->warn("Loader: '{}' не уложился в таймаут уровня", name);
            markFailed(name, std::current_exception());
        } catch (const TaskFailedError& e) {
            markFailed(name, e.cause());
        } catch (const TaskCancelledError& e) {
            logger->warn("Loader: загрузка '{}' отменена", name);
            markFailed(name, std::current_exception());
        }
    }

    // Заглушки ставятся в очередь раньше загрузок уровня и не ожидаются:
    // медленная заглушка не задерживает загрузку компонентов
    void showSkeletons(const std::vector<std::string>& tier) {
        auto self = shared_from_this();
        for (const auto& name : tier) {
            SkeletonCallback skeleton;
            {
                std::lock_guard<std::mutex> lock(mutex);
                const auto& component = components.at(name);
                if (!component.skeleton || skeletonsShown.count(name) > 0) continue;
                skeletonsShown.insert(name);
                skeleton = component.skeleton;
            }
            try {
                auto id = scheduler->submit([self, skeleton]() -> std::any {
                    {
                        std::lock_guard<std::mutex> lock(self->mutex);
                        if (!self->skeletonShownMs && self->startTime) {
                            self->skeletonShownMs = elapsedMs(*self->startTime);
                            self->logger->info("Loader: первая заглушка показана через {:.2f} ms",
                                               *self->skeletonShownMs);
                        }
                    }
                    skeleton();
                    return std::any();
                });
                std::lock_guard<std::mutex> lock(mutex);
                skeletonTasks.push_back(id);
            } catch (const SchedulerShutdownError& e) {
                logger->warn("Loader: заглушка '{}' не показана: {}", name, e.what());
                return;
            }
        }
    }

    void sweepTier(Priority priority, const std::vector<std::string>& tier) {
        if (tier.empty()) return;
        logger->info("Loader: уровень {} ({} компонентов)", toString(priority), tier.size());

        auto self = shared_from_this();
        std::vector<std::pair<std::string, scheduler::TaskId>> submitted;
        for (const auto& name : tier) {
            if (stopping) break;
            std::optional<std::string> failedDependency;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (values.count(name) > 0) continue;
                for (const auto& dep : components.at(name).dependencies) {
                    if (failed.count(dep) > 0) {
                        failedDependency = dep;
                        break;
                    }
                }
            }
            if (failedDependency) {
                logger->error("Loader: '{}' пропущен, зависимость '{}' не загружена", name, *failedDependency);
                markFailed(name, std::make_exception_ptr(
                    IgnitionError("Зависимость '" + *failedDependency + "' компонента '" + name + "' не загружена")));
                continue;
            }
            try {
                auto id = scheduler->submit([self, name](scheduler::TaskContext& context) -> std::any {
                    context.throwIfCancelled();
                    return self->graph.resolve(name);
                });
                submitted.emplace_back(name, id);
            } catch (const SchedulerShutdownError& e) {
                logger->error("Loader: '{}' не отправлен: {}", name, e.what());
                markFailed(name, std::current_exception());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            inflight.clear();
            for (const auto& entry : submitted) inflight.push_back(entry.second);
        }
        auto deadline = config.componentTimeout
            ? std::optional<Clock::time_point>(Clock::now() + *config.componentTimeout) : std::nullopt;
        for (const auto& [name, id] : submitted) {
            awaitTask(name, id, deadline);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            inflight.clear();
        }
    }

    void sweep() {
        validateRegistration();
        {
            std::lock_guard<std::mutex> lock(mutex);
            startTime = Clock::now();
            endTime.reset();
            skeletonShownMs.reset();
            interactiveMs.reset();
            failed.clear();
        }
        logger->info("Loader: старт прогрессивной загрузки ({} компонентов)", registrationOrder.size());

        for (auto priority : kAllPriorities) {
            if (stopping) {
                logger->warn("Loader: обход прерван shutdown");
                break;
            }
            if (priority == Priority::Deferred && !config.sweepDeferred) {
                continue;
            }
            auto tier = tierMembers(priority);
            if (priority == Priority::Critical) {
                showSkeletons(tier);
            }
            sweepTier(priority, tier);
            if (priority == Priority::High) {
                std::lock_guard<std::mutex> lock(mutex);
                interactiveMs = elapsedMs(*startTime);
                logger->info("Loader: interactive через {:.2f} ms (цель {} ms)", *interactiveMs,
                             config.interactiveBudget.count());
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        endTime = Clock::now();
        logger->info("Loader: загрузка завершена за {:.2f} ms, загружено {}/{}, ошибок {}",
                     elapsedMs(*startTime, *endTime), values.size(), components.size(), failed.size());
    }
};

PriorityLoader::PriorityLoader(std::shared_ptr<scheduler::TaskScheduler> scheduler,
                               std::shared_ptr<cache::ResourceCache> cache,
                               std::shared_ptr<pool::ComponentPool> pool,
                               const LoaderConfig& config) {
    if (!scheduler) {
        throw ConfigurationError("PriorityLoader требует планировщик");
    }
    if (!config.validate()) {
        throw ConfigurationError("Некорректная конфигурация загрузчика");
    }
    pImpl = std::make_shared<Impl>(std::move(scheduler), std::move(cache), std::move(pool), config);
}

PriorityLoader::~PriorityLoader() {
    shutdown();
}

void PriorityLoader::registerComponent(ComponentConfig config) {
    if (!config.validate()) {
        throw ConfigurationError("Некорректная конфигурация компонента '" + config.name + "'");
    }
    if (config.poolKind && !pImpl->pool) {
        throw ConfigurationError("Компонент '" + config.name + "' требует ComponentPool");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->components.count(config.name) > 0) {
        throw ConfigurationError("Компонент '" + config.name + "' уже зарегистрирован");
    }
    for (const auto& dep : config.dependencies) {
        auto it = pImpl->components.find(dep);
        if (it != pImpl->components.end() && it->second.priority > config.priority) {
            throw ConfigurationError("Компонент '" + config.name + "' зависит от '" + dep +
                                     "' более позднего уровня (" + toString(it->second.priority) + ")");
        }
    }
    for (const auto& [name, other] : pImpl->components) {
        bool dependsOnNew = std::find(other.dependencies.begin(), other.dependencies.end(), config.name) !=
                            other.dependencies.end();
        if (dependsOnNew && config.priority > other.priority) {
            throw ConfigurationError("Компонент '" + name + "' зависит от '" + config.name +
                                     "' более позднего уровня (" + toString(config.priority) + ")");
        }
    }
    if (config.skeleton && config.priority != Priority::Critical) {
        pImpl->logger->warn("Loader: заглушка '{}' будет проигнорирована (уровень {})", config.name,
                            toString(config.priority));
    }

    std::string name = config.name;
    Impl* impl = pImpl.get();
    pImpl->graph.registerNode(name, [impl, name]() { return impl->loadComponent(name); }, config.dependencies);
    pImpl->registrationOrder.push_back(name);
    pImpl->components.emplace(name, std::move(config));
    pImpl->logger->debug("Loader: зарегистрирован '{}'", name);
}

void PriorityLoader::start() {
    if (pImpl->running.exchange(true)) {
        throw ConfigurationError("Загрузка уже выполняется");
    }
    try {
        pImpl->sweep();
    } catch (...) {
        pImpl->running = false;
        throw;
    }
    pImpl->running = false;
}

std::optional<std::any> PriorityLoader::getComponent(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->values.find(name);
    if (it == pImpl->values.end()) return std::nullopt;
    return it->second;
}

std::optional<std::any> PriorityLoader::loadOnDemand(const std::string& name,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->components.count(name) == 0) {
            pImpl->logger->error("Loader: loadOnDemand неизвестного '{}'", name);
            return std::nullopt;
        }
        auto it = pImpl->values.find(name);
        if (it != pImpl->values.end()) return it->second;
    }

    auto self = pImpl;
    scheduler::TaskId id;
    try {
        id = pImpl->scheduler->submit([self, name](scheduler::TaskContext& context) -> std::any {
            context.throwIfCancelled();
            self->forgetFailures(name);
            return self->graph.resolve(name);
        });
    } catch (const SchedulerShutdownError& e) {
        pImpl->logger->error("Loader: loadOnDemand '{}': {}", name, e.what());
        return std::nullopt;
    }

    try {
        return pImpl->scheduler->await(id, timeout);
    } catch (const TaskFailedError& e) {
        pImpl->markFailed(name, e.cause());
        return std::nullopt;
    } catch (const TaskCancelledError& e) {
        pImpl->logger->warn("Loader: loadOnDemand '{}' отменён", name);
        return std::nullopt;
    }
}

LoaderStats PriorityLoader::stats() const {
    LoaderStats stats;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    stats.totalCount = pImpl->components.size();
    stats.loadedCount = pImpl->values.size();
    stats.failedCount = pImpl->failed.size();
    stats.perComponentMs = pImpl->durations;
    double total = 0.0;
    for (const auto& [name, ms] : pImpl->durations) total += ms;
    stats.averageLoadTimeMs = pImpl->durations.empty() ? 0.0 : total / static_cast<double>(pImpl->durations.size());
    if (pImpl->startTime) {
        stats.totalTimeMs = elapsedMs(*pImpl->startTime, pImpl->endTime ? *pImpl->endTime : Clock::now());
    }
    stats.skeletonShownMs = pImpl->skeletonShownMs;
    stats.interactiveMs = pImpl->interactiveMs;
    stats.targetMet = pImpl->interactiveMs.has_value() &&
                      *pImpl->interactiveMs < static_cast<double>(pImpl->config.interactiveBudget.count());
    return stats;
}

void PriorityLoader::addProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->progressCallbacks.push_back(std::move(callback));
}

void PriorityLoader::addCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->completionCallbacks.push_back(std::move(callback));
}

void PriorityLoader::addErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->errorCallbacks.push_back(std::move(callback));
}

bool PriorityLoader::isLoaded(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->values.count(name) > 0;
}

std::vector<std::string> PriorityLoader::failedComponents() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> result;
    for (const auto& [name, error] : pImpl->failed) result.push_back(name);
    return result;
}

std::vector<std::string> PriorityLoader::registeredComponents() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->registrationOrder;
}

bool PriorityLoader::unloadComponent(const std::string& name) {
    pool::Instance instance;
    std::optional<std::string> kind;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->values.erase(name) == 0) return false;
        auto it = pImpl->pooled.find(name);
        if (it != pImpl->pooled.end()) {
            instance = it->second;
            kind = pImpl->components.at(name).poolKind;
            pImpl->pooled.erase(it);
        }
    }
    pImpl->graph.unload(name);
    if (instance && kind && pImpl->pool) {
        pImpl->pool->release(*kind, instance);
    }
    pImpl->logger->info("Loader: '{}' выгружен", name);
    return true;
}

void PriorityLoader::shutdown() {
    if (pImpl->stopping.exchange(true)) {
        return;
    }
    std::vector<scheduler::TaskId> inflight;
    std::vector<std::string> pooledNames;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        inflight = pImpl->inflight;
        inflight.insert(inflight.end(), pImpl->skeletonTasks.begin(), pImpl->skeletonTasks.end());
        pImpl->skeletonTasks.clear();
        for (const auto& [name, instance] : pImpl->pooled) pooledNames.push_back(name);
    }
    size_t cancelled = 0;
    for (const auto& id : inflight) {
        if (pImpl->scheduler->cancel(id)) ++cancelled;
    }
    for (const auto& name : pooledNames) {
        unloadComponent(name);
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->progressCallbacks.clear();
        pImpl->completionCallbacks.clear();
        pImpl->errorCallbacks.clear();
    }
    pImpl->logger->info("Loader: shutdown, отменено {} загрузок, возвращено в пул {}", cancelled, pooledNames.size());
}

} // namespace loader
} // namespace ignition
