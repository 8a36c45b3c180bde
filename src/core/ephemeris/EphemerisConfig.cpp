#include "core/ephemeris/EphemerisConfig.hpp"
#include "core/errors/Exceptions.hpp"
#include "core/logging/Logging.hpp"
#include <cstdlib>
#include <fstream>

namespace crius {
namespace core {
namespace ephemeris {

std::string resolveEphemerisPath(const std::optional<std::string>& explicitPath) {
    if (explicitPath) {
        return *explicitPath;
    }
    const char* fromEnv = std::getenv(kEphemerisPathEnv);
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    return kDefaultEphemerisPath;
}

EphemerisConfig EphemerisConfig::load(const std::optional<std::string>& explicitPath) {
    EphemerisConfig config;
    config.ephemerisPath = resolveEphemerisPath(explicitPath);
    logging::getLogger("ephemeris")->info("Путь к эфемеридам: {}", config.ephemerisPath);
    return config;
}

EphemerisConfig EphemerisConfig::fromJson(const nlohmann::json& j) {
    EphemerisConfig config;
    try {
        std::optional<std::string> explicitPath;
        if (j.contains("ephemeris_path") && !j.at("ephemeris_path").is_null()) {
            explicitPath = j.at("ephemeris_path").get<std::string>();
        }
        config.ephemerisPath = resolveEphemerisPath(explicitPath);
        if (j.contains("cache")) {
            config.cache = cache::CacheConfig::fromJson(j.at("cache"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw errors::ConfigurationError(std::string("Некорректная конфигурация: ") + e.what());
    }
    return config;
}

EphemerisConfig EphemerisConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw errors::ConfigurationError("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw errors::ConfigurationError("Ошибка разбора " + path + ": " + e.what());
    }
    auto config = fromJson(j);
    logging::getLogger("ephemeris")->info("Конфигурация загружена из {}", path);
    return config;
}

nlohmann::json EphemerisConfig::toJson() const {
    return {
        {"ephemeris_path", ephemerisPath},
        {"cache", cache.toJson()}
    };
}

} // namespace ephemeris
} // namespace core
} // namespace crius
