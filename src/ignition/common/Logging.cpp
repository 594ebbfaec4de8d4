#include "ignition/common/Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace ignition {
namespace logging {

namespace {

std::mutex& sinksMutex() {
    static std::mutex m;
    return m;
}

// Общие sinks процесса, используются всеми подсистемными логгерами
std::vector<spdlog::sink_ptr>& processSinks() {
    static std::vector<spdlog::sink_ptr> sinks;
    return sinks;
}

spdlog::level::level_enum& currentLevel() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

spdlog::level::level_enum levelFromString(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str возвращает off для неизвестных имён
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace

nlohmann::json LoggingConfig::toJson() const {
    return {
        {"level", std::string(spdlog::level::to_string_view(level).data(),
                              spdlog::level::to_string_view(level).size())},
        {"enableConsole", enableConsole},
        {"enableFile", enableFile},
        {"filePath", filePath},
        {"maxFileSize", maxFileSize},
        {"maxFiles", maxFiles},
        {"pattern", pattern}
    };
}

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    LoggingConfig config;
    if (j.contains("level")) config.level = levelFromString(j.at("level").get<std::string>());
    config.enableConsole = j.value("enableConsole", config.enableConsole);
    config.enableFile = j.value("enableFile", config.enableFile);
    config.filePath = j.value("filePath", config.filePath);
    config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
    config.maxFiles = j.value("maxFiles", config.maxFiles);
    config.pattern = j.value("pattern", config.pattern);
    return config;
}

void initializeLogging(const LoggingConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.enableConsole) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(config.pattern);
            sinks.push_back(console_sink);
        }
        if (config.enableFile) {
            std::filesystem::path path(config.filePath);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            file_sink->set_pattern(config.pattern);
            sinks.push_back(file_sink);
        }

        std::lock_guard<std::mutex> lock(sinksMutex());
        processSinks() = sinks;
        currentLevel() = config.level;

        // Пересоздаём уже зарегистрированные логгеры на новых sinks
        std::vector<std::string> names;
        spdlog::apply_all([&names](std::shared_ptr<spdlog::logger> logger) {
            names.push_back(logger->name());
        });
        for (const auto& name : names) {
            if (name.empty()) continue;
            spdlog::drop(name);
            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(config.level);
            spdlog::register_logger(logger);
        }

        auto defaultLogger = std::make_shared<spdlog::logger>("ignition", sinks.begin(), sinks.end());
        defaultLogger->set_level(config.level);
        spdlog::set_default_logger(defaultLogger);
        spdlog::set_level(config.level);
        spdlog::info("Logging system initialized");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    }
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(sinksMutex());
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    try {
        std::shared_ptr<spdlog::logger> logger;
        auto& sinks = processSinks();
        if (sinks.empty()) {
            // Логирование не инициализировано: делим sinks default-логгера
            auto fallback = spdlog::default_logger();
            logger = std::make_shared<spdlog::logger>(name, fallback->sinks().begin(), fallback->sinks().end());
        } else {
            logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        }
        logger->set_level(currentLevel());
        spdlog::register_logger(logger);
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        // Гонка регистрации с другим потоком
        std::cerr << "Logger '" << name << "' registration: " << e.what() << std::endl;
        if (auto existing = spdlog::get(name)) return existing;
        return spdlog::default_logger();
    }
}

void setLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(sinksMutex());
    currentLevel() = level;
    spdlog::set_level(level);
}

} // namespace logging
} // namespace ignition
