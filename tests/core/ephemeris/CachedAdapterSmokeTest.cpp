#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>
#include "core/ephemeris/CachedSwissEphemerisAdapter.hpp"
#include "core/errors/Exceptions.hpp"
#include "StubProviders.hpp"

using namespace crius::core::ephemeris;
using crius::core::cache::CacheConfig;
using crius::core::errors::ConfigurationError;
using crius::core::errors::EphemerisCalculationError;
using namespace crius::test;

void smokeTestCachedAdapter() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);
    assert(adapter.getCacheStats().maxSize == 256);
    assert(&adapter.provider() == &provider);

    auto first = adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
    auto second = adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
    assert(provider.calls == 1);
    assert(first == second);
    assert(first.toJson() == second.toJson());
    assert(first.planets.size() == 5);
    assert(first.houses.has_value());

    auto stats = adapter.getCacheStats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.size == 1);
    assert(std::fabs(stats.hitRate - 0.5) < 1e-12);
    std::cout << "[OK] CachedSwissEphemerisAdapter smoke test\n";
}

void testInvalidConfiguration() {
    CountingProvider provider;
    CacheConfig config;
    config.maxSize = 0;
    bool thrown = false;
    try {
        CachedSwissEphemerisAdapter adapter(provider, config);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] CachedSwissEphemerisAdapter rejects maxsize 0\n";
}

void testCanonicalInputsHit() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);

    auto settings = sampleSettings();
    adapter.calcPositions(newYear2024(), newYork(), settings);

    // Тот же момент в другом часовом поясе
    DateTime moscow = newYear2024();
    moscow.hour = 15;
    moscow.utcOffsetMinutes = 180;

    // Те же объекты в другом порядке
    auto reordered = EphemerisSettings::fromJson({
        {"zodiac_type", "tropical"},
        {"ayanamsa", nullptr},
        {"house_system", "PLACIDUS"},
        {"include_objects", {"mars", "venus", "mercury", "moon", "sun"}}
    });
    auto positions = adapter.calcPositions(moscow, newYork(), reordered);
    assert(provider.calls == 1);
    assert(adapter.getCacheStats().hits == 1);
    assert(positions.planets.size() == 5);
    std::cout << "[OK] CachedSwissEphemerisAdapter canonical inputs hit\n";
}

void testDistinctInputsMiss() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);
    auto settings = sampleSettings();

    adapter.calcPositions(newYear2024(), newYork(), settings);
    adapter.calcPositions(newYear2024(), std::nullopt, settings);

    auto sidereal = settings;
    sidereal.zodiacType = ZodiacType::Sidereal;
    adapter.calcPositions(newYear2024(), newYork(), sidereal);

    auto koch = settings;
    koch.houseSystem = HouseSystem::Koch;
    auto kochPositions = adapter.calcPositions(newYear2024(), newYork(), koch);

    assert(provider.calls == 4);
    assert(adapter.getCacheStats().misses == 4);
    assert(kochPositions.houses && kochPositions.houses->system == HouseSystem::Koch);
    std::cout << "[OK] CachedSwissEphemerisAdapter distinct inputs miss\n";
}

void testErrorTransparency() {
    FailingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);

    for (int attempt = 1; attempt <= 2; ++attempt) {
        bool thrown = false;
        try {
            adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
        } catch (const EphemerisCalculationError& e) {
            thrown = true;
            assert(e.planetId() && *e.planetId() == "sun");
            assert(std::string(e.what()).find("(planet: sun)") != std::string::npos);
        }
        assert(thrown);
        auto stats = adapter.getCacheStats();
        assert(stats.misses == static_cast<size_t>(attempt));
        assert(stats.hits == 0);
        assert(stats.size == 0);
    }
    assert(provider.calls == 2);
    std::cout << "[OK] CachedSwissEphemerisAdapter error transparency\n";
}

void testEvictionThroughAdapter() {
    CountingProvider provider;
    CacheConfig config;
    config.maxSize = 2;
    CachedSwissEphemerisAdapter adapter(provider, config);
    auto settings = sampleSettings();

    DateTime a = newYear2024();
    DateTime b = newYear2024();
    b.hour = 13;
    DateTime c = newYear2024();
    c.hour = 14;

    adapter.calcPositions(a, std::nullopt, settings);
    adapter.calcPositions(b, std::nullopt, settings);
    adapter.calcPositions(a, std::nullopt, settings);  // попадание, A свежее B
    adapter.calcPositions(c, std::nullopt, settings);  // вытесняет B
    assert(provider.calls == 3);

    adapter.calcPositions(a, std::nullopt, settings);
    assert(provider.calls == 3);
    adapter.calcPositions(b, std::nullopt, settings);
    assert(provider.calls == 4);

    auto stats = adapter.getCacheStats();
    assert(stats.size == 2);
    assert(stats.evictions == 2);
    std::cout << "[OK] CachedSwissEphemerisAdapter LRU eviction\n";
}

void testClearCache() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);
    adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
    adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
    adapter.clearCache();

    auto stats = adapter.getCacheStats();
    assert(stats.size == 0);
    assert(stats.hits == 1);
    assert(stats.misses == 1);

    adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
    assert(provider.calls == 2);
    assert(adapter.getCacheStats().misses == 2);
    std::cout << "[OK] CachedSwissEphemerisAdapter clearCache keeps counters\n";
}

void testUnkeyableInputsBypassCache() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);

    GeoLocation broken{std::numeric_limits<double>::quiet_NaN(), 0.0};
    adapter.calcPositions(newYear2024(), broken, sampleSettings());
    adapter.calcPositions(newYear2024(), broken, sampleSettings());

    DateTime invalid = newYear2024();
    invalid.month = 13;
    adapter.calcPositions(invalid, std::nullopt, sampleSettings());

    assert(provider.calls == 3);
    auto stats = adapter.getCacheStats();
    assert(stats.hits == 0 && stats.misses == 0 && stats.size == 0);
    std::cout << "[OK] CachedSwissEphemerisAdapter bypasses cache for unkeyable inputs\n";
}

void testOutOfRangeYearBypassesCache() {
    CountingProvider provider;
    CachedSwissEphemerisAdapter adapter(provider);

    DateTime epoch;
    epoch.year = 1970;

    // Ровно 2^64 мкс после эпохи: без ограничения года ключ совпал бы с epoch
    DateTime farFuture;
    farFuture.year = 586524;
    farFuture.month = 1;
    farFuture.day = 19;
    farFuture.hour = 8;
    farFuture.minute = 1;
    farFuture.second = 49;
    farFuture.microsecond = 551616;
    assert(!farFuture.isValid());

    DateTime yearZero;
    yearZero.year = 0;
    assert(!yearZero.isValid());

    adapter.calcPositions(epoch, std::nullopt, sampleSettings());
    adapter.calcPositions(farFuture, std::nullopt, sampleSettings());
    adapter.calcPositions(yearZero, std::nullopt, sampleSettings());
    assert(provider.calls == 3);

    auto stats = adapter.getCacheStats();
    assert(stats.hits == 0);
    assert(stats.misses == 1);
    assert(stats.size == 1);
    std::cout << "[OK] CachedSwissEphemerisAdapter out-of-range year bypasses cache\n";
}

void concurrentTestCachedAdapter() {
    SleepingProvider provider(std::chrono::milliseconds(20));
    CachedSwissEphemerisAdapter adapter(provider);

    const int threadCount = 50;
    std::vector<std::thread> threads;
    std::vector<LayerPositions> results(threadCount);
    for (int i = 0; i < threadCount; ++i) {
        threads.emplace_back([&adapter, &results, i]() {
            results[static_cast<size_t>(i)] =
                adapter.calcPositions(newYear2024(), newYork(), sampleSettings());
        });
    }
    for (auto& th : threads) th.join();

    assert(provider.calls == 1);
    for (const auto& result : results) {
        assert(result == results.front());
    }
    auto stats = adapter.getCacheStats();
    assert(stats.misses == 1);
    assert(stats.hits == static_cast<size_t>(threadCount - 1));
    std::cout << "[OK] CachedSwissEphemerisAdapter concurrent single computation\n";
}

void concurrentTestProviderSerialization() {
    SleepingProvider provider(std::chrono::milliseconds(2));
    CachedSwissEphemerisAdapter adapter(provider);

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&adapter, i]() {
            DateTime dt = newYear2024();
            dt.minute = i;  // разные ключи - каждый поток промахивается
            adapter.calcPositions(dt, newYork(), sampleSettings());
        });
    }
    for (auto& th : threads) th.join();

    assert(provider.calls == 16);
    assert(provider.maxInFlight == 1);
    std::cout << "[OK] CachedSwissEphemerisAdapter serializes provider calls\n";
}

int main() {
    smokeTestCachedAdapter();
    testInvalidConfiguration();
    testCanonicalInputsHit();
    testDistinctInputsMiss();
    testErrorTransparency();
    testEvictionThroughAdapter();
    testClearCache();
    testUnkeyableInputsBypassCache();
    testOutOfRangeYearBypassesCache();
    concurrentTestCachedAdapter();
    concurrentTestProviderSerialization();
    std::cout << "All CachedSwissEphemerisAdapter tests passed!\n";
    return 0;
}
