#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"

namespace crius {
namespace core {
namespace ephemeris {

constexpr const char* kEphemerisPathEnv = "SWISS_EPHEMERIS_PATH";
constexpr const char* kDefaultEphemerisPath = "/usr/local/share/swisseph";

/**
 * @brief Путь к данным эфемерид.
 * @details Порядок: явный аргумент > переменная окружения SWISS_EPHEMERIS_PATH
 *          (если задана и не пуста) > /usr/local/share/swisseph.
 */
std::string resolveEphemerisPath(const std::optional<std::string>& explicitPath = std::nullopt);

/**
 * @brief Конфигурация провайдера и кэша.
 * @details Путь разрешается один раз при построении конфигурации и передаётся
 *          в конструктор провайдера явно.
 */
struct EphemerisConfig {
    std::string ephemerisPath = kDefaultEphemerisPath;
    cache::CacheConfig cache;

    static EphemerisConfig load(const std::optional<std::string>& explicitPath = std::nullopt);
    /// @throws errors::ConfigurationError
    static EphemerisConfig fromJson(const nlohmann::json& j);
    /// @throws errors::ConfigurationError если файл отсутствует или некорректен
    static EphemerisConfig fromFile(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace ephemeris
} // namespace core
} // namespace crius
