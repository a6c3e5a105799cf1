#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dr {

struct ExpiringCacheConfig {
    int maxEntries = 1000;
    int ttlSeconds = 3600;
    int shardCount = 8;
};

struct ExpiringCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;    // Removed by size pressure
    uint64_t expirations = 0;  // Removed because the TTL elapsed
    int currentSize = 0;
};

// ExpiringCache -- sharded TTL cache with insertion-order eviction.
//
// An entry lives for ttlSeconds from the moment it was inserted; reading it
// never extends that. Lookups treat an expired entry as a miss and drop it.
//
// maxEntries bounds the whole cache, not each shard. Every entry carries a
// cache-wide insertion sequence; once an insert takes the total past
// maxEntries, the entry with the lowest sequence in any shard is removed, so
// eviction is FIFO over the whole cache whatever the shard count. Lookups and
// inserts below capacity hold only the key's shard lock; eviction takes every
// shard lock in index order.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ExpiringCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit ExpiringCache(ExpiringCacheConfig config = {}, ClockFn clock = {})
        : m_config(config)
        , m_clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
    {
        m_capacity = std::max(1, m_config.maxEntries);
        const int shards = std::clamp(m_config.shardCount, 1, m_capacity);
        m_shards.reserve(static_cast<size_t>(shards));
        for (int i = 0; i < shards; ++i) {
            m_shards.push_back(std::make_unique<Shard>());
        }
    }

    ExpiringCache(const ExpiringCache&) = delete;
    ExpiringCache& operator=(const ExpiringCache&) = delete;

    std::optional<Value> get(const Key& key)
    {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.index.find(key);
        if (it == shard.index.end()) {
            ++shard.misses;
            return std::nullopt;
        }

        if (isExpired(it->second->insertedAt)) {
            shard.entries.erase(it->second);
            shard.index.erase(it);
            m_size.fetch_sub(1);
            ++shard.expirations;
            ++shard.misses;
            return std::nullopt;
        }

        ++shard.hits;
        return it->second->value;
    }

    void put(const Key& key, Value value)
    {
        {
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);

            // Re-inserting restarts the entry's lifetime.
            auto existing = shard.index.find(key);
            if (existing != shard.index.end()) {
                shard.entries.erase(existing->second);
                shard.index.erase(existing);
                m_size.fetch_sub(1);
            }

            while (!shard.entries.empty() && isExpired(shard.entries.back().insertedAt)) {
                shard.index.erase(shard.entries.back().key);
                shard.entries.pop_back();
                m_size.fetch_sub(1);
                ++shard.expirations;
            }

            // Front = newest insertion. The sequence is drawn under the shard
            // lock, so each shard's list stays ordered by it.
            shard.entries.push_front({key, std::move(value), m_clock(), m_sequence.fetch_add(1)});
            shard.index[key] = shard.entries.begin();
            m_size.fetch_add(1);
        }

        if (m_size.load() > m_capacity) {
            trimToCapacity();
        }
    }

    void clear()
    {
        for (auto& shard : m_shards) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            m_size.fetch_sub(static_cast<int>(shard->entries.size()));
            shard->entries.clear();
            shard->index.clear();
        }
    }

    ExpiringCacheStats stats() const
    {
        ExpiringCacheStats total;
        for (const auto& shard : m_shards) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            total.hits += shard->hits;
            total.misses += shard->misses;
            total.evictions += shard->evictions;
            total.expirations += shard->expirations;
            total.currentSize += static_cast<int>(shard->entries.size());
        }
        return total;
    }

    int shardCount() const { return static_cast<int>(m_shards.size()); }
    const ExpiringCacheConfig& config() const { return m_config; }

private:
    struct Entry {
        Key key;
        Value value;
        Clock::time_point insertedAt;
        uint64_t sequence = 0;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::list<Entry> entries;
        std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
    };

    Shard& shardFor(const Key& key)
    {
        const size_t slot = m_hash(key) % m_shards.size();
        return *m_shards[slot];
    }

    // Removes cache-wide oldest insertions until the total fits. With a
    // shared TTL the oldest entry is also the first to expire, so expired
    // entries always leave before live ones.
    void trimToCapacity()
    {
        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(m_shards.size());
        for (auto& shard : m_shards) {
            locks.emplace_back(shard->mutex);
        }

        while (m_size.load() > m_capacity) {
            Shard* oldest = nullptr;
            for (auto& shard : m_shards) {
                if (shard->entries.empty()) {
                    continue;
                }
                if (!oldest
                    || shard->entries.back().sequence < oldest->entries.back().sequence) {
                    oldest = shard.get();
                }
            }
            if (!oldest) {
                break;
            }

            const Entry& victim = oldest->entries.back();
            if (isExpired(victim.insertedAt)) {
                ++oldest->expirations;
            } else {
                ++oldest->evictions;
            }
            oldest->index.erase(victim.key);
            oldest->entries.pop_back();
            m_size.fetch_sub(1);
        }
    }

    bool isExpired(Clock::time_point insertedAt) const
    {
        return m_clock() - insertedAt >= std::chrono::seconds(m_config.ttlSeconds);
    }

    ExpiringCacheConfig m_config;
    ClockFn m_clock;
    Hash m_hash;
    int m_capacity = 1;
    std::atomic<int> m_size{0};
    std::atomic<uint64_t> m_sequence{0};
    std::vector<std::unique_ptr<Shard>> m_shards;
};

} // namespace dr
