#pragma once

#include <cstdint>
#include <string>

// Deterministic cache key: "tts:" + hex(SHA-256) over the length-prefixed
// fields. Text is hashed verbatim, no trimming or case folding. No per-process
// salt, so keys stay valid across restarts. Empty when the digest fails.
std::string cache_key_derive(const std::string & model_id, const std::string & text, int32_t sample_rate);

// Lowercase hex SHA-256 of `data`. Empty string on digest failure.
std::string sha256_hex(const std::string & data);

// True for a full "tts:" + 64 hex digit key.
bool cache_key_is_valid(const std::string & key);
