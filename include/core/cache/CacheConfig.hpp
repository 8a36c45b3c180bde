#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

namespace crius {
namespace core {
namespace cache {

// Конфигурация кэша эфемерид
struct CacheConfig {
    size_t maxSize = 256;         // Максимальное количество записей
    int coordinatePrecision = 4;  // Знаков после запятой для координат (~11 м)

    bool validate() const {
        if (maxSize == 0) return false;
        if (coordinatePrecision < 0 || coordinatePrecision > 10) return false;
        return true;
    }

    /// @throws errors::ConfigurationError
    static CacheConfig fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const {
        return {
            {"maxsize", maxSize},
            {"coordinate_precision", coordinatePrecision}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace crius
