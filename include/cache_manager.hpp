#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <vector>
#include <string>

namespace context_engine {

// Bounded map evicted strictly by insertion order: reads never refresh an
// entry, and overwriting a key keeps its original slot.
template<typename Key, typename Value>
class InsertionOrderCache {
public:
    explicit InsertionOrderCache(size_t max_size) : max_size_(max_size) {}

    std::optional<Value> get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_size_ == 0) return;

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            return;
        }

        while (cache_map_.size() >= max_size_) {
            // Oldest insertion sits at the back
            auto oldest = cache_list_.back();
            cache_list_.pop_back();
            cache_map_.erase(oldest);
        }

        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin()};
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.count(key) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

    size_t capacity() const { return max_size_; }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
    };

    size_t max_size_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

using EmbeddingCache = InsertionOrderCache<std::string, std::vector<float>>;

} // namespace context_engine
