#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "types.hpp"

namespace renko {

struct CacheEntry {
    RenkoResult result;
    std::chrono::system_clock::time_point created_at;
};

struct CacheLookup {
    std::shared_ptr<const CacheEntry> entry;
    bool hit = false;
    double age_seconds = 0.0;
};

struct CacheInfo {
    std::string key;
    std::chrono::system_clock::time_point cached_at;
    double age_seconds;
    std::size_t brick_count;
    std::size_t original_rows;
    std::string source_path;
};

// Latest RenkoResult per source key, reused while younger than the TTL.
//
// Concurrent misses on the same key are serialized: the first caller runs
// compute_fn while holding that key's mutex, later callers block on it and
// then find the fresh entry. Different keys compute independently.
// Entries are immutable once published; readers hold them by shared_ptr.
class ResultCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using ComputeFn = std::function<RenkoResult()>;

    explicit ResultCache(std::chrono::seconds ttl = std::chrono::seconds(300),
                         Clock clock = &std::chrono::system_clock::now);

    CacheLookup get_or_compute(const std::string& key, const ComputeFn& compute_fn);

    bool invalidate(const std::string& key);
    std::size_t invalidate_all();

    std::vector<CacheInfo> inspect() const;
    std::size_t size() const;
    // Keys with an entry or a caller currently inside get_or_compute.
    std::size_t tracked_keys() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Slot {
        std::mutex compute_mutex;
        std::shared_ptr<const CacheEntry> entry;
        std::size_t users = 0; // guarded by mutex_
    };

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> acquire(const std::string& key);
    void release(const std::string& key, const std::shared_ptr<Slot>& slot);
    double age_of(const CacheEntry& entry) const;
};

} // namespace renko
