#include "cache-key.h"

#include <gtest/gtest.h>

#include <random>
#include <set>
#include <string>

TEST(CacheKey, KnownDigest) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(cache_key_derive("en_US-ryan-medium", "Hello!", 16000),
              "tts:4ec5f8a84a09a410c44dd193e73e4b2b73728de77e74ff19e866510017335a50");
}

TEST(CacheKey, StableFormat) {
    const std::string key = cache_key_derive("en_US-kathleen-low", "Hello world", 22050);
    EXPECT_EQ(key, "tts:796ca6f67e2b3966738b08e6be16fa9494e557ebf08615ff100c7d04d4bc1d91");
    ASSERT_EQ(key.size(), 4u + 64u);
    EXPECT_EQ(key.compare(0, 4, "tts:"), 0);
    for (size_t i = 4; i < key.size(); ++i) {
        const char c = key[i];
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << "at " << i;
    }
}

TEST(CacheKey, Deterministic) {
    EXPECT_EQ(cache_key_derive("m", "some text", 16000), cache_key_derive("m", "some text", 16000));
}

TEST(CacheKey, FieldBoundaryIsUnambiguous) {
    const std::string a = cache_key_derive("a", "b:c", 16000);
    const std::string b = cache_key_derive("a:b", "c", 16000);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, "tts:d06151c6c9589fc81a0c8a353c7dfb49b6ca41010c94c38e607ea5338d669605");
    EXPECT_EQ(b, "tts:0e3566a143c10b05b6d2a0ba577ea0c41b4e92ba5f461c7ab4554dc63093f27d");

    // Digits of the text must not bleed into the rate.
    EXPECT_NE(cache_key_derive("m", "x1", 6000), cache_key_derive("m", "x", 16000));
    EXPECT_NE(cache_key_derive("", "ab", 1), cache_key_derive("a", "b", 1));
}

TEST(CacheKey, TextIsVerbatim) {
    const std::string base = cache_key_derive("m", "Hello world", 16000);
    EXPECT_NE(base, cache_key_derive("m", "hello world", 16000));
    EXPECT_NE(base, cache_key_derive("m", "Hello world ", 16000));
    EXPECT_NE(base, cache_key_derive("m", " Hello world", 16000));
    EXPECT_NE(base, cache_key_derive("m", "Hello  world", 16000));
}

TEST(CacheKey, EachFieldChangesKey) {
    const std::string base = cache_key_derive("en_US-ryan-medium", "text", 16000);
    EXPECT_NE(base, cache_key_derive("en_US-ryan-low", "text", 16000));
    EXPECT_NE(base, cache_key_derive("en_US-ryan-medium", "text.", 16000));
    EXPECT_NE(base, cache_key_derive("en_US-ryan-medium", "text", 22050));
}

TEST(CacheKey, NoCollisionsAcrossRandomTriples) {
    std::mt19937 rng(1234);
    const std::string alphabet = "abcdefghijklmnopqrstuvwxyzABC:_-. 0123456789";
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::uniform_int_distribution<int> len(0, 12);
    const int32_t rates[] = {8000, 16000, 22050, 24000, 44100, 48000};
    std::uniform_int_distribution<int> rate_idx(0, 5);

    auto random_string = [&]() {
        std::string s;
        const int n = len(rng);
        for (int i = 0; i < n; ++i) {
            s.push_back(alphabet[pick(rng)]);
        }
        return s;
    };

    std::set<std::string> triples;
    std::set<std::string> keys;
    for (int i = 0; i < 5000; ++i) {
        const std::string model = random_string();
        const std::string text = random_string();
        const int32_t rate = rates[rate_idx(rng)];

        const std::string triple = std::to_string(model.size()) + "|" + model + "|" + text + "|" + std::to_string(rate);
        if (!triples.insert(triple).second) {
            continue;
        }
        EXPECT_TRUE(keys.insert(cache_key_derive(model, text, rate)).second)
            << "collision for model='" << model << "' text='" << text << "' rate=" << rate;
    }
    EXPECT_EQ(keys.size(), triples.size());
}

TEST(CacheKey, ValidityRejectsPrefixOnlyKeys) {
    EXPECT_TRUE(cache_key_is_valid(cache_key_derive("en_US-kathleen-low", "Hello world", 22050)));
    EXPECT_FALSE(cache_key_is_valid(""));
    EXPECT_FALSE(cache_key_is_valid("tts:"));
    EXPECT_FALSE(cache_key_is_valid("tts:" + std::string(63, 'a')));
    EXPECT_FALSE(cache_key_is_valid("tts:" + std::string(64, 'A')));
    EXPECT_FALSE(cache_key_is_valid("key:" + std::string(64, 'a')));
    EXPECT_TRUE(cache_key_is_valid("tts:" + std::string(64, '0')));
}
