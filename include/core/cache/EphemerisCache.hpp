#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/cache/CacheKey.hpp"
#include "core/cache/CacheStats.hpp"
#include "core/ephemeris/EphemerisTypes.hpp"
#include "core/errors/Exceptions.hpp"
#include "core/logging/Logging.hpp"

namespace crius {
namespace core {
namespace cache {

/**
 * @brief Ограниченный LRU-кэш со статистикой попаданий и промахов.
 * @details get/put - O(1) амортизированно: хеш-таблица + список порядка использования.
 *          Значения не изменяются после сохранения. Все операции потокобезопасны
 *          (один мьютекс на всю структуру).
 *          clear() не сбрасывает счётчики: статистика отражает всё время жизни кэша,
 *          для явного сброса используйте resetStats().
 * @tparam Key Тип ключа
 * @tparam Value Тип значения
 * @tparam Hash Хеш-функция ключа
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class EphemerisCache {
public:
    using KeyType = Key;
    using DataType = Value;

    /// @throws errors::ConfigurationError если maxSize == 0
    explicit EphemerisCache(size_t maxSize);

    EphemerisCache(const EphemerisCache&) = delete;
    EphemerisCache& operator=(const EphemerisCache&) = delete;

    /// Попадание переносит запись в начало LRU-списка.
    std::optional<Value> get(const Key& key);
    /// Вставка или перезапись; при заполненном кэше вытесняется одна LRU-запись.
    void put(const Key& key, const Value& value);
    /// Проверка наличия без влияния на статистику и порядок LRU.
    bool contains(const Key& key) const;
    void remove(const Key& key);
    void clear();
    void resetStats();

    CacheStats stats() const;
    size_t size() const;
    size_t maxSize() const { return maxSize_; }

private:
    struct Entry {
        Value value;
        typename std::list<Key>::iterator lruPosition;
    };

    void evictLRU();

    const size_t maxSize_;
    std::unordered_map<Key, Entry, Hash> cache_;
    std::list<Key> lruList_;  // front - самая свежая запись
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Кэш результатов расчёта позиций
using PositionsCache = EphemerisCache<CacheKey, ephemeris::LayerPositions, CacheKeyHash>;

template<typename Key, typename Value, typename Hash>
EphemerisCache<Key, Value, Hash>::EphemerisCache(size_t maxSize)
    : maxSize_(maxSize)
    , logger_(logging::getLogger("ephemeris_cache")) {
    if (maxSize_ == 0) {
        throw errors::ConfigurationError("maxsize кэша должен быть положительным");
    }
    cache_.reserve(maxSize_);
}

template<typename Key, typename Value, typename Hash>
std::optional<Value> EphemerisCache<Key, Value, Hash>::get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    lruList_.splice(lruList_.begin(), lruList_, it->second.lruPosition);
    return it->second.value;
}

template<typename Key, typename Value, typename Hash>
void EphemerisCache<Key, Value, Hash>::put(const Key& key, const Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        Value copy(value);
        it->second.value = std::move(copy);
        lruList_.splice(lruList_.begin(), lruList_, it->second.lruPosition);
        return;
    }

    // Сначала выделяем узел списка и запись, затем вытесняем:
    // при исключении аллокации кэш остаётся неизменным.
    lruList_.push_front(key);
    try {
        cache_.emplace(key, Entry{value, lruList_.begin()});
    } catch (...) {
        lruList_.pop_front();
        throw;
    }
    if (cache_.size() > maxSize_) {
        evictLRU();
    }
}

template<typename Key, typename Value, typename Hash>
bool EphemerisCache<Key, Value, Hash>::contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

template<typename Key, typename Value, typename Hash>
void EphemerisCache<Key, Value, Hash>::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        lruList_.erase(it->second.lruPosition);
        cache_.erase(it);
    }
}

template<typename Key, typename Value, typename Hash>
void EphemerisCache<Key, Value, Hash>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed = cache_.size();
    cache_.clear();
    lruList_.clear();
    logger_->debug("Кэш очищен: удалено {} записей", removed);
}

template<typename Key, typename Value, typename Hash>
void EphemerisCache<Key, Value, Hash>::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

template<typename Key, typename Value, typename Hash>
CacheStats EphemerisCache<Key, Value, Hash>::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.size = cache_.size();
    stats.maxSize = maxSize_;
    stats.evictions = evictions_;
    const size_t total = hits_ + misses_;
    stats.hitRate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    return stats;
}

template<typename Key, typename Value, typename Hash>
size_t EphemerisCache<Key, Value, Hash>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

// Вызывается под mutex_
template<typename Key, typename Value, typename Hash>
void EphemerisCache<Key, Value, Hash>::evictLRU() {
    if (lruList_.empty()) return;
    cache_.erase(lruList_.back());
    lruList_.pop_back();
    ++evictions_;
    logger_->trace("LRU-вытеснение, записей: {}", cache_.size());
}

} // namespace cache
} // namespace core
} // namespace crius
