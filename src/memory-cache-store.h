#pragma once

#include "cache-store.h"

#include <chrono>
#include <mutex>
#include <unordered_map>

// In-process store with per-entry expiry. Expired entries are dropped lazily
// on lookup and when the entry limit is reached.
class memory_cache_store : public cache_store {
public:
    explicit memory_cache_store(size_t max_entries = 4096);

    bool get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & err) override;
    bool set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) override;
    const char * name() const override { return "memory"; }

    size_t size() const;

private:
    struct entry {
        std::vector<uint8_t> value;
        std::chrono::steady_clock::time_point expires_at;
    };

    void evict_locked(std::chrono::steady_clock::time_point now);

    size_t max_entries_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, entry> entries_;
};
