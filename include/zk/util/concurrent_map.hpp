#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace zk {

/**
 * ConcurrentMap - Hash map split into independently locked shards.
 *
 * Each shard has its own reader/writer lock, so mutations of keys in
 * different shards never contend. Single-key operations are atomic.
 * Whole-map operations (clear, retain, for_each, snapshot) visit shards one
 * at a time and are not atomic as a whole.
 */
template <typename K, typename V, typename Hash = std::hash<K>, size_t ShardCount = 16>
class ConcurrentMap {
public:
    ConcurrentMap() = default;
    ConcurrentMap(const ConcurrentMap&) = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;

    std::optional<V> get(const K& key) const {
        const Shard& shard = shard_for(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const K& key) const {
        const Shard& shard = shard_for(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        return shard.map.count(key) > 0;
    }

    // Insert or overwrite
    void insert_or_assign(const K& key, V value) {
        Shard& shard = shard_for(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.map.insert_or_assign(key, std::move(value));
    }

    /**
     * Mutate the value for `key` in place under the shard lock.
     * A default-constructed value is inserted first if the key is absent.
     */
    template <typename F>
    void upsert(const K& key, F&& fn) {
        Shard& shard = shard_for(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        fn(shard.map[key]);
    }

    bool erase(const K& key) {
        Shard& shard = shard_for(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return shard.map.erase(key) > 0;
    }

    /**
     * Visit every entry mutably; entries for which `fn` returns false are
     * removed.
     */
    template <typename F>
    void retain(F&& fn) {
        for (Shard& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            for (auto it = shard.map.begin(); it != shard.map.end();) {
                if (fn(it->first, it->second)) {
                    ++it;
                } else {
                    it = shard.map.erase(it);
                }
            }
        }
    }

    // Visit every entry read-only
    template <typename F>
    void for_each(F&& fn) const {
        for (const Shard& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                fn(key, value);
            }
        }
    }

    std::vector<std::pair<K, V>> snapshot() const {
        std::vector<std::pair<K, V>> entries;
        for_each([&entries](const K& key, const V& value) {
            entries.emplace_back(key, value);
        });
        return entries;
    }

    void clear() {
        for (Shard& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.map.clear();
        }
    }

    size_t size() const {
        size_t total = 0;
        for (const Shard& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    bool empty() const { return size() == 0; }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<K, V, Hash> map;
    };

    Shard& shard_for(const K& key) {
        return shards_[hasher_(key) % ShardCount];
    }

    const Shard& shard_for(const K& key) const {
        return shards_[hasher_(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
    Hash hasher_;
};

}  // namespace zk
