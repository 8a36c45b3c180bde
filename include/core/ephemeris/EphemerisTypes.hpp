#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crius {
namespace core {
namespace ephemeris {

/**
 * @brief Гражданские дата и время со смещением относительно UTC.
 * @details Один и тот же физический момент может быть записан с разными смещениями;
 *          для сравнения используйте toUtcMicros().
 */
struct DateTime {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    int utcOffsetMinutes = 0;  // UTC+03:00 -> 180

    /// Проверка диапазонов полей (год 1..9999). @throws errors::ConfigurationError
    void validate() const;
    bool isValid() const;
    /// Микросекунды от эпохи Unix для физического момента.
    int64_t toUtcMicros() const;
    /// Тот же момент с нулевым смещением.
    DateTime toUtc() const;
    /// Юлианская дата (UT), григорианский календарь, разрешение в секунду.
    double toJulianDay() const;
    /// ISO-8601 с указанием смещения.
    std::string toString() const;

    static DateTime fromUtcMicros(int64_t micros);
};

struct GeoLocation {
    double lat = 0.0;
    double lon = 0.0;

    void validate() const;
    nlohmann::json toJson() const { return {{"lat", lat}, {"lon", lon}}; }
};

enum class ZodiacType {
    Tropical,
    Sidereal
};

// Поддерживаемые айанамши; "chitrapaksha" читается как Lahiri
enum class Ayanamsa {
    Lahiri,
    FaganBradley,
    DeLuce,
    Raman,
    Krishnamurti,
    Yukteshwar,
    DjwhalKhul,
    TrueCitra,
    TrueRevati,
    Aryabhata,
    AryabhataMeanSun
};

enum class HouseSystem {
    Placidus,
    WholeSign,
    Koch,
    Equal,
    Regiomontanus,
    Campanus,
    Alcabitius,
    Morinus
};

enum class CelestialObject {
    Sun,
    Moon,
    Mercury,
    Venus,
    Mars,
    Jupiter,
    Saturn,
    Uranus,
    Neptune,
    Pluto,
    Chiron,
    NorthNode,
    SouthNode
};

// Айанамша по умолчанию для сидерического зодиака без явного выбора
constexpr Ayanamsa kDefaultAyanamsa = Ayanamsa::Lahiri;

std::string toString(ZodiacType type);
std::string toString(Ayanamsa ayanamsa);
std::string toString(HouseSystem system);
std::string toString(CelestialObject object);

/// Однобуквенный код системы домов Swiss Ephemeris ('P', 'W', ...).
char houseSystemCode(HouseSystem system);

/// @throws errors::ConfigurationError
ZodiacType parseZodiacType(const std::string& name);
/// @throws errors::InvalidAyanamsaError
Ayanamsa parseAyanamsa(const std::string& name);
/// @throws errors::InvalidHouseSystemError
HouseSystem parseHouseSystem(const std::string& name);
std::optional<CelestialObject> parseCelestialObject(const std::string& name);

std::vector<std::string> ayanamsaNames();
std::vector<std::string> houseSystemNames();

/**
 * @brief Настройки расчёта.
 * @note includeObjects - множество, порядок запроса не важен.
 */
struct EphemerisSettings {
    ZodiacType zodiacType = ZodiacType::Tropical;
    std::optional<Ayanamsa> ayanamsa;
    HouseSystem houseSystem = HouseSystem::Placidus;
    std::set<CelestialObject> includeObjects;

    /**
     * @brief Чтение из JSON вида {"zodiac_type", "ayanamsa", "house_system", "include_objects"}.
     * @details Неизвестные объекты пропускаются с предупреждением.
     */
    static EphemerisSettings fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

struct PlanetPosition {
    double lon = 0.0;
    double lat = 0.0;
    double speedLon = 0.0;
    bool retrograde = false;

    nlohmann::json toJson() const;
    bool operator==(const PlanetPosition& other) const;
    bool operator!=(const PlanetPosition& other) const { return !(*this == other); }
};

struct HouseAngles {
    double asc = 0.0;
    double mc = 0.0;
    double ic = 0.0;
    double dc = 0.0;

    bool operator==(const HouseAngles& other) const;
};

struct HousePositions {
    HouseSystem system = HouseSystem::Placidus;
    std::map<int, double> cusps;  // номер дома 1..12 -> градусы
    HouseAngles angles;

    nlohmann::json toJson() const;
    bool operator==(const HousePositions& other) const;
};

/**
 * @brief Результат расчёта: позиции объектов и, при наличии места наблюдения, дома.
 */
struct LayerPositions {
    std::map<CelestialObject, PlanetPosition> planets;
    std::optional<HousePositions> houses;

    nlohmann::json toJson() const;
    bool operator==(const LayerPositions& other) const;
    bool operator!=(const LayerPositions& other) const { return !(*this == other); }
};

/// Знак зодиака ("aries".."pisces") для долготы в градусах.
/// @throws errors::ConfigurationError для NaN и бесконечности
std::string zodiacSign(double longitude);

} // namespace ephemeris
} // namespace core
} // namespace crius
