#include "core/ephemeris/EphemerisTypes.hpp"
#include "core/errors/Exceptions.hpp"
#include "core/logging/Logging.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <utility>

namespace crius {
namespace core {
namespace ephemeris {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kMicrosPerDay = 86400 * kMicrosPerSecond;
constexpr double kUnixEpochJulianDay = 2440587.5;
constexpr int kMaxOffsetMinutes = 18 * 60;
// Диапазон лет григорианского календаря, для которого toUtcMicros не переполняется
constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

// Количество дней от 1970-01-01 (пролептический григорианский календарь)
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return days[static_cast<size_t>(m - 1)];
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::array<std::pair<Ayanamsa, const char*>, 11> kAyanamsaNames = {{
    {Ayanamsa::Lahiri, "lahiri"},
    {Ayanamsa::FaganBradley, "fagan_bradley"},
    {Ayanamsa::DeLuce, "de_luce"},
    {Ayanamsa::Raman, "raman"},
    {Ayanamsa::Krishnamurti, "krishnamurti"},
    {Ayanamsa::Yukteshwar, "yukteshwar"},
    {Ayanamsa::DjwhalKhul, "djwhal_khul"},
    {Ayanamsa::TrueCitra, "true_citra"},
    {Ayanamsa::TrueRevati, "true_revati"},
    {Ayanamsa::Aryabhata, "aryabhata"},
    {Ayanamsa::AryabhataMeanSun, "aryabhata_mean_sun"},
}};

struct HouseSystemInfo {
    HouseSystem system;
    const char* name;
    char code;
};

const std::array<HouseSystemInfo, 8> kHouseSystems = {{
    {HouseSystem::Placidus, "placidus", 'P'},
    {HouseSystem::WholeSign, "whole_sign", 'W'},
    {HouseSystem::Koch, "koch", 'K'},
    {HouseSystem::Equal, "equal", 'E'},
    {HouseSystem::Regiomontanus, "regiomontanus", 'R'},
    {HouseSystem::Campanus, "campanus", 'C'},
    {HouseSystem::Alcabitius, "alcabitius", 'A'},
    {HouseSystem::Morinus, "morinus", 'M'},
}};

const std::array<std::pair<CelestialObject, const char*>, 13> kObjectNames = {{
    {CelestialObject::Sun, "sun"},
    {CelestialObject::Moon, "moon"},
    {CelestialObject::Mercury, "mercury"},
    {CelestialObject::Venus, "venus"},
    {CelestialObject::Mars, "mars"},
    {CelestialObject::Jupiter, "jupiter"},
    {CelestialObject::Saturn, "saturn"},
    {CelestialObject::Uranus, "uranus"},
    {CelestialObject::Neptune, "neptune"},
    {CelestialObject::Pluto, "pluto"},
    {CelestialObject::Chiron, "chiron"},
    {CelestialObject::NorthNode, "north_node"},
    {CelestialObject::SouthNode, "south_node"},
}};

const std::array<const char*, 12> kSigns = {
    "aries", "taurus", "gemini", "cancer", "leo", "virgo",
    "libra", "scorpio", "sagittarius", "capricorn", "aquarius", "pisces"
};

} // namespace

// ---------------------------------------------------------------------------
// DateTime

void DateTime::validate() const {
    if (year < kMinYear || year > kMaxYear) {
        throw errors::ConfigurationError("Некорректный год: " + std::to_string(year));
    }
    if (month < 1 || month > 12) {
        throw errors::ConfigurationError("Некорректный месяц: " + std::to_string(month));
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        throw errors::ConfigurationError("Некорректный день: " + std::to_string(day));
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw errors::ConfigurationError("Некорректное время: " + toString());
    }
    if (microsecond < 0 || microsecond >= kMicrosPerSecond) {
        throw errors::ConfigurationError("Некорректные микросекунды: " + std::to_string(microsecond));
    }
    if (utcOffsetMinutes < -kMaxOffsetMinutes || utcOffsetMinutes > kMaxOffsetMinutes) {
        throw errors::ConfigurationError("Некорректное смещение UTC: " + std::to_string(utcOffsetMinutes));
    }
}

bool DateTime::isValid() const {
    return year >= kMinYear && year <= kMaxYear
        && month >= 1 && month <= 12
        && day >= 1 && day <= daysInMonth(year, month)
        && hour >= 0 && hour <= 23
        && minute >= 0 && minute <= 59
        && second >= 0 && second <= 59
        && microsecond >= 0 && microsecond < kMicrosPerSecond
        && utcOffsetMinutes >= -kMaxOffsetMinutes && utcOffsetMinutes <= kMaxOffsetMinutes;
}

int64_t DateTime::toUtcMicros() const {
    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t seconds = static_cast<int64_t>(hour) * 3600 + minute * 60 + second
        - static_cast<int64_t>(utcOffsetMinutes) * 60;
    return days * kMicrosPerDay + seconds * kMicrosPerSecond + microsecond;
}

DateTime DateTime::fromUtcMicros(int64_t micros) {
    DateTime dt;
    const int64_t days = floorDiv(micros, kMicrosPerDay);
    int64_t rest = micros - days * kMicrosPerDay;
    civilFromDays(days, dt.year, dt.month, dt.day);
    dt.hour = static_cast<int>(rest / (3600 * kMicrosPerSecond));
    rest %= 3600 * kMicrosPerSecond;
    dt.minute = static_cast<int>(rest / (60 * kMicrosPerSecond));
    rest %= 60 * kMicrosPerSecond;
    dt.second = static_cast<int>(rest / kMicrosPerSecond);
    dt.microsecond = static_cast<int>(rest % kMicrosPerSecond);
    dt.utcOffsetMinutes = 0;
    return dt;
}

DateTime DateTime::toUtc() const {
    return fromUtcMicros(toUtcMicros());
}

double DateTime::toJulianDay() const {
    const int64_t seconds = floorDiv(toUtcMicros(), kMicrosPerSecond);
    return kUnixEpochJulianDay + static_cast<double>(seconds) / 86400.0;
}

std::string DateTime::toString() const {
    char buffer[64];
    const int absOffset = utcOffsetMinutes < 0 ? -utcOffsetMinutes : utcOffsetMinutes;
    const char sign = utcOffsetMinutes < 0 ? '-' : '+';
    if (microsecond != 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06d%c%02d:%02d",
                      year, month, day, hour, minute, second, microsecond,
                      sign, absOffset / 60, absOffset % 60);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
                      year, month, day, hour, minute, second,
                      sign, absOffset / 60, absOffset % 60);
    }
    return buffer;
}

void GeoLocation::validate() const {
    if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0) {
        throw errors::ConfigurationError("Некорректная широта: " + std::to_string(lat));
    }
    if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0) {
        throw errors::ConfigurationError("Некорректная долгота: " + std::to_string(lon));
    }
}

// ---------------------------------------------------------------------------
// Перечисления

std::string toString(ZodiacType type) {
    return type == ZodiacType::Sidereal ? "sidereal" : "tropical";
}

std::string toString(Ayanamsa ayanamsa) {
    for (const auto& [value, name] : kAyanamsaNames) {
        if (value == ayanamsa) return name;
    }
    return "unknown";
}

std::string toString(HouseSystem system) {
    for (const auto& info : kHouseSystems) {
        if (info.system == system) return info.name;
    }
    return "unknown";
}

std::string toString(CelestialObject object) {
    for (const auto& [value, name] : kObjectNames) {
        if (value == object) return name;
    }
    return "unknown";
}

char houseSystemCode(HouseSystem system) {
    for (const auto& info : kHouseSystems) {
        if (info.system == system) return info.code;
    }
    return 'P';
}

ZodiacType parseZodiacType(const std::string& name) {
    const auto lower = toLower(name);
    if (lower == "tropical") return ZodiacType::Tropical;
    if (lower == "sidereal") return ZodiacType::Sidereal;
    throw errors::ConfigurationError("Некорректный тип зодиака: " + name);
}

Ayanamsa parseAyanamsa(const std::string& name) {
    const auto lower = toLower(name);
    if (lower == "chitrapaksha") return Ayanamsa::Lahiri;
    for (const auto& [value, valueName] : kAyanamsaNames) {
        if (lower == valueName) return value;
    }
    throw errors::InvalidAyanamsaError(name, ayanamsaNames());
}

HouseSystem parseHouseSystem(const std::string& name) {
    const auto lower = toLower(name);
    for (const auto& info : kHouseSystems) {
        if (lower == info.name) return info.system;
    }
    throw errors::InvalidHouseSystemError(name, houseSystemNames());
}

std::optional<CelestialObject> parseCelestialObject(const std::string& name) {
    const auto lower = toLower(name);
    for (const auto& [value, valueName] : kObjectNames) {
        if (lower == valueName) return value;
    }
    return std::nullopt;
}

std::vector<std::string> ayanamsaNames() {
    std::vector<std::string> names;
    for (const auto& entry : kAyanamsaNames) {
        names.emplace_back(entry.second);
    }
    names.emplace_back("chitrapaksha");
    return names;
}

std::vector<std::string> houseSystemNames() {
    std::vector<std::string> names;
    for (const auto& info : kHouseSystems) {
        names.emplace_back(info.name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// EphemerisSettings

EphemerisSettings EphemerisSettings::fromJson(const nlohmann::json& j) {
    EphemerisSettings settings;
    try {
        if (j.contains("zodiac_type") && !j.at("zodiac_type").is_null()) {
            settings.zodiacType = parseZodiacType(j.at("zodiac_type").get<std::string>());
        }
        if (j.contains("ayanamsa") && !j.at("ayanamsa").is_null()) {
            const auto name = j.at("ayanamsa").get<std::string>();
            if (!name.empty()) {
                settings.ayanamsa = parseAyanamsa(name);
            }
        }
        settings.houseSystem = parseHouseSystem(j.at("house_system").get<std::string>());
        if (j.contains("include_objects")) {
            for (const auto& item : j.at("include_objects")) {
                const auto name = item.get<std::string>();
                auto object = parseCelestialObject(name);
                if (!object) {
                    logging::getLogger("ephemeris")->warn("Неизвестный объект пропущен: {}", name);
                    continue;
                }
                settings.includeObjects.insert(*object);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw errors::ConfigurationError(std::string("Некорректные настройки расчёта: ") + e.what());
    }
    return settings;
}

nlohmann::json EphemerisSettings::toJson() const {
    nlohmann::json objects = nlohmann::json::array();
    for (const auto& object : includeObjects) {
        objects.push_back(toString(object));
    }
    return {
        {"zodiac_type", toString(zodiacType)},
        {"ayanamsa", ayanamsa ? nlohmann::json(toString(*ayanamsa)) : nlohmann::json(nullptr)},
        {"house_system", toString(houseSystem)},
        {"include_objects", objects}
    };
}

// ---------------------------------------------------------------------------
// Позиции

nlohmann::json PlanetPosition::toJson() const {
    return {
        {"lon", lon},
        {"lat", lat},
        {"speed_lon", speedLon},
        {"retrograde", retrograde}
    };
}

bool PlanetPosition::operator==(const PlanetPosition& other) const {
    return lon == other.lon && lat == other.lat
        && speedLon == other.speedLon && retrograde == other.retrograde;
}

bool HouseAngles::operator==(const HouseAngles& other) const {
    return asc == other.asc && mc == other.mc && ic == other.ic && dc == other.dc;
}

nlohmann::json HousePositions::toJson() const {
    nlohmann::json cuspsJson = nlohmann::json::object();
    for (const auto& [house, degrees] : cusps) {
        cuspsJson[std::to_string(house)] = degrees;
    }
    return {
        {"system", toString(system)},
        {"cusps", cuspsJson},
        {"angles", {{"asc", angles.asc}, {"mc", angles.mc}, {"ic", angles.ic}, {"dc", angles.dc}}}
    };
}

bool HousePositions::operator==(const HousePositions& other) const {
    return system == other.system && cusps == other.cusps && angles == other.angles;
}

nlohmann::json LayerPositions::toJson() const {
    nlohmann::json planetsJson = nlohmann::json::object();
    for (const auto& [object, position] : planets) {
        planetsJson[toString(object)] = position.toJson();
    }
    return {
        {"planets", planetsJson},
        {"houses", houses ? houses->toJson() : nlohmann::json(nullptr)}
    };
}

bool LayerPositions::operator==(const LayerPositions& other) const {
    return planets == other.planets && houses == other.houses;
}

std::string zodiacSign(double longitude) {
    if (!std::isfinite(longitude)) {
        throw errors::ConfigurationError("Некорректная долгота: " + std::to_string(longitude));
    }
    double normalized = std::fmod(longitude, 360.0);
    if (normalized < 0.0) normalized += 360.0;
    if (normalized >= 360.0) normalized = 0.0;
    int index = static_cast<int>(normalized / 30.0);
    index = std::min(std::max(0, index), 11);
    return kSigns[static_cast<size_t>(index)];
}

} // namespace ephemeris
} // namespace core
} // namespace crius
