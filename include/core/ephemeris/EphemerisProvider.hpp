#pragma once

#include <optional>
#include "core/ephemeris/EphemerisTypes.hpp"

namespace crius {
namespace core {
namespace ephemeris {

/**
 * @brief Источник эфемерид (например, обёртка над Swiss Ephemeris).
 * @details Расчёт должен быть детерминированным для фиксированных входных данных:
 *          на этом основан кэш.
 * @note Реализации не обязаны быть потокобезопасными: провайдер может хранить
 *       внутреннее состояние (выбранный сидерический режим), изменяемое при расчёте.
 */
class EphemerisProvider {
public:
    virtual ~EphemerisProvider() = default;

    /**
     * @brief Расчёт позиций объектов и домов.
     * @param instant Момент времени
     * @param location Место наблюдения; без него дома не рассчитываются
     * @param settings Настройки расчёта
     * @throws errors::EphemerisFileNotFoundError, errors::EphemerisCalculationError,
     *         errors::InvalidHouseSystemError, errors::InvalidAyanamsaError
     */
    virtual LayerPositions calcPositions(const DateTime& instant,
                                         const std::optional<GeoLocation>& location,
                                         const EphemerisSettings& settings) = 0;
};

} // namespace ephemeris
} // namespace core
} // namespace crius
