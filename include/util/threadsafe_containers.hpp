#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netsession {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::unordered_map or std::map
 *
 * Purpose:
 * - Eliminate repeated mutex + map patterns (session registry, broadcast
 *   port map)
 * - Provide safe, atomic single-operation access to key-value storage
 *
 * Usage:
 *   ThreadSafeMap<std::string, SessionPtr> sessions_;
 *   sessions_.Insert(key, session);
 *   if (auto s = sessions_.Get(key)) { ... }
 *   sessions_.EraseIf(key, [&](const SessionPtr& v) { return v == session; });
 *
 * Design decisions:
 * - Every operation takes the internal lock once and releases it before
 *   returning; only EraseIf() runs caller code (its predicate) under the lock
 * - Values are expected to be cheap to copy (shared_ptr, small structs)
 * - No iterator-based API to avoid lock lifetime issues
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Copy of the value for key, or std::nullopt
     */
    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * Remove entry by key
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * Remove entry only if predicate(value) holds
     * Used to drop a registration only while it still refers to a given owner
     */
    template <typename Pred>
    bool EraseIf(const Key& key, Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end() && predicate(it->second)) {
            map_.erase(it);
            return true;
        }
        return false;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.empty();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * Snapshot of all entries (safe to iterate without lock)
     */
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

    /**
     * Snapshot of all values, removing them from the map in the same step
     */
    std::vector<Value> TakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Value> values;
        values.reserve(map_.size());
        for (auto& [key, value] : map_) {
            values.push_back(std::move(value));
        }
        map_.clear();
        return values;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace netsession
