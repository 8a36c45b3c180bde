#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace crius {
namespace core {
namespace logging {

// Конфигурация логирования
struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool logToFile = false;
    std::string filePath = "logs/crius.log";
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;
};

/**
 * @brief Инициализация логгера по умолчанию (консоль + опционально ротируемый файл).
 * @throws spdlog::spdlog_ex если файловый sink не удалось создать
 */
void initializeLogging(const LoggingConfig& config = LoggingConfig{});

/**
 * @brief Получить именованный логгер, при отсутствии создаётся консольный.
 * @note Никогда не возвращает nullptr.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

} // namespace logging
} // namespace core
} // namespace crius
