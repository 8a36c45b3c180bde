#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheStats.hpp"
#include "core/cache/EphemerisCache.hpp"
#include "core/ephemeris/EphemerisProvider.hpp"

namespace crius {
namespace core {
namespace ephemeris {

/**
 * @brief Кэширующий декоратор над провайдером эфемерид.
 * @details При попадании провайдер не вызывается. При промахе результат провайдера
 *          сохраняется в кэш; исключения провайдера пробрасываются без изменений
 *          и ничего не кэшируется.
 *
 *          Проверка кэша, вызов провайдера и сохранение выполняются под одним мьютексом:
 *          одновременно выполняется не более одного вызова провайдера, а потоки,
 *          промахнувшиеся по одному ключу, получают уже вычисленный результат.
 *
 *          Входные данные, для которых нельзя построить стабильный ключ (некорректная
 *          дата, нечисловые координаты), передаются провайдеру напрямую, минуя кэш.
 *
 * @note Провайдер не принадлежит адаптеру и должен пережить его.
 */
class CachedSwissEphemerisAdapter : public EphemerisProvider {
public:
    /// @throws errors::ConfigurationError при некорректной конфигурации кэша
    explicit CachedSwissEphemerisAdapter(EphemerisProvider& provider,
                                         const cache::CacheConfig& config = cache::CacheConfig{});

    CachedSwissEphemerisAdapter(const CachedSwissEphemerisAdapter&) = delete;
    CachedSwissEphemerisAdapter& operator=(const CachedSwissEphemerisAdapter&) = delete;

    LayerPositions calcPositions(const DateTime& instant,
                                 const std::optional<GeoLocation>& location,
                                 const EphemerisSettings& settings) override;

    cache::CacheStats getCacheStats() const;
    // Счётчики при очистке сохраняются
    void clearCache();

    EphemerisProvider& provider() const { return provider_; }
    const cache::CacheConfig& cacheConfig() const { return config_; }

private:
    LayerPositions callProvider(const DateTime& instant,
                                const std::optional<GeoLocation>& location,
                                const EphemerisSettings& settings,
                                const std::string& keyDescription);

    EphemerisProvider& provider_;
    cache::CacheConfig config_;
    cache::PositionsCache cache_;
    std::mutex providerMutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ephemeris
} // namespace core
} // namespace crius
