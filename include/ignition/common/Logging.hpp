#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace ignition {
namespace logging {

// LoggingConfig: параметры логирования (уровень, файл, ротация)
struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info; // Уровень
    bool enableConsole = true;                             // Консольный sink
    bool enableFile = false;                               // Файловый sink
    std::string filePath = "logs/ignition.log";            // Путь
    size_t maxFileSize = 1024 * 1024 * 5;                  // 5 MB
    size_t maxFiles = 2;                                   // Кол-во файлов ротации
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    bool validate() const {
        if (enableFile && (filePath.empty() || maxFileSize == 0 || maxFiles == 0)) return false;
        return !pattern.empty();
    }
    nlohmann::json toJson() const;
    static LoggingConfig fromJson(const nlohmann::json& j);
};

// Настроить sinks и default logger процесса
void initializeLogging(const LoggingConfig& config);

// Получить именованный логгер подсистемы (создаётся при первом обращении)
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Установить уровень для всех зарегистрированных логгеров
void setLevel(spdlog::level::level_enum level);

} // namespace logging
} // namespace ignition
