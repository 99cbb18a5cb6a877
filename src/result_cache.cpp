#include "../include/renko/result_cache.hpp"
#include <utility>

namespace renko {

ResultCache::ResultCache(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

std::shared_ptr<ResultCache::Slot> ResultCache::acquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[key];
    if (!slot) slot = std::make_shared<Slot>();
    ++slot->users;
    return slot;
}

// Drops the slot once nobody uses it and it holds no entry.
void ResultCache::release(const std::string& key, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--slot->users == 0 && !slot->entry) {
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second == slot) slots_.erase(it);
    }
}

double ResultCache::age_of(const CacheEntry& entry) const {
    std::chrono::duration<double> age = clock_() - entry.created_at;
    return age.count();
}

CacheLookup ResultCache::get_or_compute(const std::string& key, const ComputeFn& compute_fn) {
    auto slot = acquire(key);
    struct Releaser {
        ResultCache& cache;
        const std::string& key;
        const std::shared_ptr<Slot>& slot;
        ~Releaser() { cache.release(key, slot); }
    } releaser{*this, key, slot};
    std::lock_guard<std::mutex> compute_lock(slot->compute_mutex);

    std::shared_ptr<const CacheEntry> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = slot->entry;
    }
    if (current) {
        double age = age_of(*current);
        if (age < static_cast<double>(ttl_.count())) {
            return {current, true, age};
        }
    }

    // compute_fn may throw; the slot then keeps whatever it held before.
    auto fresh = std::make_shared<CacheEntry>();
    fresh->result = compute_fn();
    fresh->created_at = clock_();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot->entry = fresh;
    }
    return {fresh, false, 0.0};
}

bool ResultCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end() || !it->second->entry) return false;
    it->second->entry.reset();
    if (it->second->users == 0) slots_.erase(it);
    return true;
}

std::size_t ResultCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t evicted = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->second->entry) {
            it->second->entry.reset();
            ++evicted;
        }
        if (it->second->users == 0) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<CacheInfo> ResultCache::inspect() const {
    std::vector<CacheInfo> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : slots_) {
        const auto& entry = kv.second->entry;
        if (!entry) continue;
        rows.push_back({
            kv.first,
            entry->created_at,
            age_of(*entry),
            entry->result.bricks.size(),
            entry->result.original_rows,
            entry->result.source_path
        });
    }
    return rows;
}

std::size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& kv : slots_) {
        if (kv.second->entry) ++n;
    }
    return n;
}

std::size_t ResultCache::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace renko
