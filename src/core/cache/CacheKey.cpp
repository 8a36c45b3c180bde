#include "core/cache/CacheKey.hpp"
#include <cmath>
#include <sstream>

namespace crius {
namespace core {
namespace cache {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

class Fnv1a64 {
public:
    void update(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            hash_ ^= static_cast<uint8_t>(value >> (i * 8));
            hash_ *= kFnvPrime;
        }
    }

    uint64_t value() const { return hash_; }

private:
    uint64_t hash_ = kFnvOffset;
};

int64_t scaleCoordinate(double degrees, int precision) {
    const double scaled = std::round(degrees * std::pow(10.0, precision));
    // Приведение к целому сводит -0.0 к 0
    return static_cast<int64_t>(scaled);
}

} // namespace

CacheKey CacheKey::make(const ephemeris::DateTime& instant,
                        const std::optional<ephemeris::GeoLocation>& location,
                        const ephemeris::EphemerisSettings& settings,
                        int coordinatePrecision) {
    CacheKey key;
    key.utcMicros = instant.toUtcMicros();
    key.precision = coordinatePrecision;
    if (location) {
        key.hasLocation = true;
        key.latScaled = scaleCoordinate(location->lat, coordinatePrecision);
        key.lonScaled = scaleCoordinate(location->lon, coordinatePrecision);
    }
    key.zodiacType = settings.zodiacType;
    if (settings.zodiacType == ephemeris::ZodiacType::Sidereal) {
        key.ayanamsa = settings.ayanamsa.value_or(ephemeris::kDefaultAyanamsa);
    }
    key.houseSystem = settings.houseSystem;
    for (const auto object : settings.includeObjects) {
        key.objectMask |= 1u << static_cast<unsigned>(object);
    }
    return key;
}

bool CacheKey::operator==(const CacheKey& other) const {
    return utcMicros == other.utcMicros
        && hasLocation == other.hasLocation
        && latScaled == other.latScaled
        && lonScaled == other.lonScaled
        && precision == other.precision
        && zodiacType == other.zodiacType
        && ayanamsa == other.ayanamsa
        && houseSystem == other.houseSystem
        && objectMask == other.objectMask;
}

std::string CacheKey::toString() const {
    std::ostringstream out;
    out << "t=" << utcMicros;
    if (hasLocation) {
        out << "|loc=" << latScaled << "," << lonScaled << "@" << precision;
    } else {
        out << "|loc=none";
    }
    out << "|z=" << ephemeris::toString(zodiacType);
    if (ayanamsa) {
        out << "|a=" << ephemeris::toString(*ayanamsa);
    }
    out << "|h=" << ephemeris::toString(houseSystem);
    out << "|o=" << std::hex << objectMask;
    return out.str();
}

size_t CacheKeyHash::operator()(const CacheKey& key) const {
    Fnv1a64 h;
    h.update(static_cast<uint64_t>(key.utcMicros));
    h.update(key.hasLocation ? 1 : 0);
    h.update(static_cast<uint64_t>(key.latScaled));
    h.update(static_cast<uint64_t>(key.lonScaled));
    h.update(static_cast<uint64_t>(key.precision));
    h.update(static_cast<uint64_t>(key.zodiacType));
    h.update(key.ayanamsa ? static_cast<uint64_t>(*key.ayanamsa) + 1 : 0);
    h.update(static_cast<uint64_t>(key.houseSystem));
    h.update(key.objectMask);
    return static_cast<size_t>(h.value());
}

} // namespace cache
} // namespace core
} // namespace crius
