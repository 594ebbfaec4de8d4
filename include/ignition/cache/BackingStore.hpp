#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace ignition {
namespace cache {

// BackingStore: второй уровень кэша: байты по хеш-ключу.
// Реализации потокобезопасны; ошибки ввода-вывода сообщаются через CacheIOError
class BackingStore {
public:
    virtual ~BackingStore() = default;
    virtual std::optional<std::string> get(const std::string& hashKey) = 0; // Прочитать
    virtual void set(const std::string& hashKey, const std::string& bytes, std::chrono::milliseconds ttl) = 0; // Записать
    virtual bool remove(const std::string& hashKey) = 0; // Удалить
    virtual std::vector<std::string> keys() = 0; // Все хеш-ключи
    virtual size_t totalBytes() = 0; // Занято байт
    virtual size_t evictToBudget(size_t maxBytes) = 0; // Удалить самые старые, пока не уложимся
    virtual void clear() = 0; // Очистить
    virtual std::string name() const = 0;
};

// SHA-256 ключа в hex; детерминированное имя записи во втором уровне
std::string hashKey(const std::string& key);

} // namespace cache
} // namespace ignition
