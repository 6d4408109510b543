#pragma once

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace codescope {

// Bounded, thread-safe LRU map. Never invalidated entry by entry: the owner
// drops the whole cache when the data behind it changes.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size) : max_size_(max_size == 0 ? 1 : max_size) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            misses_++;
            return std::nullopt;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        hits_++;
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (cache_map_.size() >= max_size_) {
            // Evict LRU
            auto lru_key = cache_list_.back();
            cache_list_.pop_back();
            cache_map_.erase(lru_key);
        }

        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin()};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

    size_t capacity() const { return max_size_; }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
    };

    size_t max_size_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

} // namespace codescope
