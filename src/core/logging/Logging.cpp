#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace crius {
namespace core {
namespace logging {

namespace {
const char* const kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
const char* const kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
}

void initializeLogging(const LoggingConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Консольный sink
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(config.level);
        consoleSink->set_pattern(kConsolePattern);
        sinks.push_back(consoleSink);

        // Файловый sink
        if (config.logToFile) {
            auto parent = std::filesystem::path(config.filePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            fileSink->set_level(spdlog::level::trace);
            fileSink->set_pattern(kPattern);
            sinks.push_back(fileSink);
        }

        auto logger = std::make_shared<spdlog::logger>("crius", sinks.begin(), sinks.end());
        logger->set_level(config.level);
        spdlog::set_default_logger(logger);
        spdlog::set_level(config.level);

        spdlog::info("Система логирования инициализирована");
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    try {
        logger = spdlog::stdout_color_mt(name);
        logger->set_pattern(kConsolePattern);
        logger->set_level(spdlog::get_level());
    } catch (const spdlog::spdlog_ex&) {
        // Логгер зарегистрирован параллельным потоком
        logger = spdlog::get(name);
    }
    return logger ? logger : spdlog::default_logger();
}

} // namespace logging
} // namespace core
} // namespace crius
