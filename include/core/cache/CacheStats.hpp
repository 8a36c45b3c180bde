#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>

namespace crius {
namespace core {
namespace cache {

struct CacheStats {
    size_t hits = 0;           // Количество попаданий
    size_t misses = 0;         // Количество промахов
    size_t size = 0;           // Текущее количество записей
    size_t maxSize = 0;        // Максимальное количество записей
    double hitRate = 0.0;      // hits / (hits + misses), 0.0 без запросов
    size_t evictions = 0;      // Количество вытеснений

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"size", size},
            {"maxsize", maxSize},
            {"hit_rate", hitRate},
            {"evictions", evictions}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace crius
