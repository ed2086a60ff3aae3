#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Key-value store holding synthesized audio under TTL-bounded writes.
// Every failure (refused connection, timeout, protocol error) is reported as
// `false` with a message; callers treat it as a miss and carry on.
class cache_store {
public:
    virtual ~cache_store() = default;

    // On success `found` tells hit from miss; `value` is only written on a hit.
    virtual bool get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & err) = 0;

    virtual bool set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) = 0;

    virtual const char * name() const = 0;
};
