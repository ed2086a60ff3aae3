#include "cache-key.h"

#include <openssl/evp.h>

#include <string>

static constexpr const char * k_cache_key_prefix = "tts:";

std::string sha256_hex(const std::string & data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int n_digest = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &n_digest, EVP_sha256(), nullptr) != 1) {
        return std::string();
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve((size_t) n_digest * 2);
    for (unsigned int i = 0; i < n_digest; ++i) {
        out.push_back(hex[(digest[i] >> 4) & 0x0F]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

std::string cache_key_derive(const std::string & model_id, const std::string & text, int32_t sample_rate) {
    // Lengths are byte counts, so a ':' inside either field cannot shift a
    // boundary.
    std::string material;
    material.reserve(model_id.size() + text.size() + 32);
    material += std::to_string(model_id.size());
    material += ':';
    material += model_id;
    material += std::to_string(text.size());
    material += ':';
    material += text;
    material += std::to_string(sample_rate);

    const std::string digest = sha256_hex(material);
    if (digest.empty()) {
        return std::string();
    }
    return std::string(k_cache_key_prefix) + digest;
}

bool cache_key_is_valid(const std::string & key) {
    const size_t n_prefix = std::char_traits<char>::length(k_cache_key_prefix);
    if (key.size() != n_prefix + 64 || key.compare(0, n_prefix, k_cache_key_prefix) != 0) {
        return false;
    }
    for (size_t i = n_prefix; i < key.size(); ++i) {
        const char c = key[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}
