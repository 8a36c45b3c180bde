#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "core/ephemeris/EphemerisTypes.hpp"

namespace crius {
namespace core {
namespace cache {

/**
 * @brief Канонический ключ кэша расчёта позиций.
 * @details Время хранится в микросекундах UTC, координаты - целыми числами,
 *          округлёнными до заданной точности, множество объектов - битовой маской.
 *          Для тропического зодиака айанамша не учитывается; сидерический
 *          зодиак без айанамши эквивалентен Lahiri.
 */
struct CacheKey {
    int64_t utcMicros = 0;
    bool hasLocation = false;
    int64_t latScaled = 0;
    int64_t lonScaled = 0;
    int precision = 0;
    ephemeris::ZodiacType zodiacType = ephemeris::ZodiacType::Tropical;
    std::optional<ephemeris::Ayanamsa> ayanamsa;
    ephemeris::HouseSystem houseSystem = ephemeris::HouseSystem::Placidus;
    uint32_t objectMask = 0;

    /// Построение ключа. Не бросает исключений для корректных входных данных.
    static CacheKey make(const ephemeris::DateTime& instant,
                         const std::optional<ephemeris::GeoLocation>& location,
                         const ephemeris::EphemerisSettings& settings,
                         int coordinatePrecision = 4);

    bool operator==(const CacheKey& other) const;
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    /// Стабильное текстовое представление для логов.
    std::string toString() const;
};

// FNV-1a по всем полям ключа
struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const;
};

} // namespace cache
} // namespace core
} // namespace crius
