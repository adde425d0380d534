// ============================================================================
// pmc/state_storage.hpp - Concurrent dense numbering of keys
// ============================================================================
//
// StripedIndex assigns dense ids 0, 1, 2, ... to keys in insertion order.
// insert() is insert-if-absent: when several threads insert the same key
// concurrently, exactly one of them creates the id and all of them receive
// it ("first insert wins").  Which key gets which number depends on thread
// interleaving; the key, not the number, is the identity.
//
// The key space is split into 64 shards, each a separate hash map behind
// its own mutex.  Locks are held for the lookup/insert only.
//
// ============================================================================

#ifndef PMC_STATE_STORAGE_HPP
#define PMC_STATE_STORAGE_HPP

#include "pmc/errors.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pmc {

// ── StripedIndex ────────────────────────────────────────────────────────────

template <typename Key, typename Hash = std::hash<Key>>
class StripedIndex {
public:
    static constexpr std::size_t kStripes = 64;

    explicit StripedIndex(std::int64_t capacity = std::numeric_limits<std::int32_t>::max())
        : capacity_(capacity) {}

    StripedIndex(const StripedIndex&)            = delete;
    StripedIndex& operator=(const StripedIndex&) = delete;

    /// Returns the id of `key` and whether this call created it.
    /// Throws CapacityError when a new id would reach the capacity.
    std::pair<std::int64_t, bool> insert(const Key& key) {
        Shard& shard = shards_[stripe(key)];
        std::lock_guard<std::mutex> lk(shard.mutex);

        auto it = shard.ids.find(key);
        if (it != shard.ids.end()) return {it->second, false};

        std::int64_t id;
        {
            std::lock_guard<std::mutex> keys_lk(keys_mutex_);
            id = static_cast<std::int64_t>(keys_.size());
            if (id >= capacity_) {
                throw CapacityError("index capacity of " + std::to_string(capacity_) +
                                    " entries exceeded");
            }
            keys_.push_back(key);
        }
        shard.ids.emplace(key, id);
        return {id, true};
    }

    /// Id of `key`, or -1 if it was never inserted.
    std::int64_t find(const Key& key) const {
        const Shard& shard = shards_[stripe(key)];
        std::lock_guard<std::mutex> lk(shard.mutex);
        auto it = shard.ids.find(key);
        return it == shard.ids.end() ? -1 : it->second;
    }

    /// Key with the given id (a copy; the key table may grow concurrently).
    Key key(std::int64_t id) const {
        std::lock_guard<std::mutex> lk(keys_mutex_);
        return keys_.at(static_cast<std::size_t>(id));
    }

    std::int64_t size() const {
        std::lock_guard<std::mutex> lk(keys_mutex_);
        return static_cast<std::int64_t>(keys_.size());
    }

    std::int64_t capacity() const noexcept { return capacity_; }

private:
    struct Shard {
        mutable std::mutex                    mutex;
        std::unordered_map<Key, std::int64_t, Hash> ids;
    };

    std::size_t stripe(const Key& key) const {
        return Hash{}(key) % kStripes;
    }

    std::array<Shard, kStripes> shards_;
    mutable std::mutex          keys_mutex_;
    std::vector<Key>            keys_;
    std::int64_t                capacity_;
};

// ── StateStorage ────────────────────────────────────────────────────────────
// Serialised model states, numbered by first discovery.

using StateVector = std::vector<std::int32_t>;

struct StateVectorHash {
    std::size_t operator()(const StateVector& v) const noexcept {
        std::size_t h = v.size();
        for (std::int32_t x : v) {
            h ^= std::hash<std::int32_t>{}(x) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

using StateStorage = StripedIndex<StateVector, StateVectorHash>;

}  // namespace pmc

#endif  // PMC_STATE_STORAGE_HPP
