#include "core/ephemeris/CachedSwissEphemerisAdapter.hpp"
#include "core/errors/Exceptions.hpp"
#include "core/logging/Logging.hpp"
#include <cmath>
#include <exception>

namespace crius {
namespace core {
namespace ephemeris {

namespace {

// Координаты за этим пределом заведомо некорректны и не кэшируются
constexpr double kMaxKeyableDegrees = 1000.0;

bool isKeyable(const DateTime& instant, const std::optional<GeoLocation>& location) {
    if (!instant.isValid()) return false;
    if (!location) return true;
    return std::isfinite(location->lat) && std::isfinite(location->lon)
        && std::fabs(location->lat) <= kMaxKeyableDegrees
        && std::fabs(location->lon) <= kMaxKeyableDegrees;
}

const cache::CacheConfig& validated(const cache::CacheConfig& config) {
    if (!config.validate()) {
        throw errors::ConfigurationError("Некорректная конфигурация кэша: " + config.toJson().dump());
    }
    return config;
}

} // namespace

CachedSwissEphemerisAdapter::CachedSwissEphemerisAdapter(EphemerisProvider& provider,
                                                         const cache::CacheConfig& config)
    : provider_(provider)
    , config_(validated(config))
    , cache_(config_.maxSize)
    , logger_(logging::getLogger("ephemeris_cache")) {
    logger_->info("Кэширующий адаптер создан: maxsize={}, точность координат={}",
                  config_.maxSize, config_.coordinatePrecision);
}

LayerPositions CachedSwissEphemerisAdapter::calcPositions(const DateTime& instant,
                                                          const std::optional<GeoLocation>& location,
                                                          const EphemerisSettings& settings) {
    std::lock_guard<std::mutex> lock(providerMutex_);

    if (!isKeyable(instant, location)) {
        logger_->debug("Вызов без кэша, ключ не строится: {}", instant.toString());
        return callProvider(instant, location, settings, instant.toString());
    }

    const auto key = cache::CacheKey::make(instant, location, settings, config_.coordinatePrecision);
    if (auto cached = cache_.get(key)) {
        logger_->debug("Кэш-попадание: {}", key.toString());
        return *cached;
    }
    logger_->debug("Кэш-промах: {}", key.toString());

    auto positions = callProvider(instant, location, settings, key.toString());
    cache_.put(key, positions);
    return positions;
}

// Вызывается под providerMutex_
LayerPositions CachedSwissEphemerisAdapter::callProvider(const DateTime& instant,
                                                         const std::optional<GeoLocation>& location,
                                                         const EphemerisSettings& settings,
                                                         const std::string& keyDescription) {
    try {
        return provider_.calcPositions(instant, location, settings);
    } catch (const std::exception& e) {
        logger_->warn("Ошибка провайдера ({}): {}", keyDescription, e.what());
        throw;
    }
}

cache::CacheStats CachedSwissEphemerisAdapter::getCacheStats() const {
    return cache_.stats();
}

void CachedSwissEphemerisAdapter::clearCache() {
    cache_.clear();
}

} // namespace ephemeris
} // namespace core
} // namespace crius
