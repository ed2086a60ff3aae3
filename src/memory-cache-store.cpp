#include "memory-cache-store.h"

memory_cache_store::memory_cache_store(size_t max_entries)
    : max_entries_(max_entries > 0 ? max_entries : 1) {
}

bool memory_cache_store::get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & /* err */) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mtx_);
    found = false;
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return true;
    }
    if (it->second.expires_at <= now) {
        entries_.erase(it);
        return true;
    }
    value = it->second.value;
    found = true;
    return true;
}

bool memory_cache_store::set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) {
    if (ttl_sec <= 0) {
        err = "ttl must be positive";
        return false;
    }
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mtx_);
    if (entries_.size() >= max_entries_ && entries_.find(key) == entries_.end()) {
        evict_locked(now);
    }
    entry & e = entries_[key];
    e.value = value;
    e.expires_at = now + std::chrono::seconds(ttl_sec);
    return true;
}

size_t memory_cache_store::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

void memory_cache_store::evict_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    if (entries_.size() < max_entries_) {
        return;
    }
    // Still full: drop the entry closest to expiry.
    auto victim = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.expires_at < victim->second.expires_at) {
            victim = it;
        }
    }
    entries_.erase(victim);
}
