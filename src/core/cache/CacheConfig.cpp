#include "core/cache/CacheConfig.hpp"
#include "core/errors/Exceptions.hpp"
#include <string>

namespace crius {
namespace core {
namespace cache {

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    try {
        if (j.contains("maxsize")) {
            // Отрицательное значение не должно молча превратиться в огромный size_t
            const auto maxSize = j.at("maxsize").get<long long>();
            if (maxSize <= 0) {
                throw errors::ConfigurationError(
                    "maxsize должен быть положительным, получено " + std::to_string(maxSize));
            }
            config.maxSize = static_cast<size_t>(maxSize);
        }
        if (j.contains("coordinate_precision")) {
            config.coordinatePrecision = j.at("coordinate_precision").get<int>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw errors::ConfigurationError(std::string("Некорректная конфигурация кэша: ") + e.what());
    }
    if (!config.validate()) {
        throw errors::ConfigurationError("Некорректная конфигурация кэша: " + config.toJson().dump());
    }
    return config;
}

} // namespace cache
} // namespace core
} // namespace crius
