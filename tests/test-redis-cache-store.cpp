#include "orchestrator.h"
#include "redis-cache-store.h"
#include "redis-resp.h"
#include "test-stubs.h"

#include <gtest/gtest.h>

#include <chrono>

static resp_parse_status parse_all(const std::string & wire, resp_reply & out, size_t & consumed) {
    std::string err;
    consumed = 0;
    return resp_parse(wire.data(), wire.size(), consumed, out, err);
}

TEST(RedisResp, EncodesCommandsAsBulkArrays) {
    EXPECT_EQ(resp_encode_command({"GET", "tts:abc"}), "*2\r\n$3\r\nGET\r\n$7\r\ntts:abc\r\n");

    const std::string binary("a\r\n\0b", 5);
    EXPECT_EQ(resp_encode_command({"SETEX", "k", "60", binary}),
            std::string("*4\r\n$5\r\nSETEX\r\n$1\r\nk\r\n$2\r\n60\r\n$5\r\na\r\n\0b\r\n", 41));
}

TEST(RedisResp, ParsesScalarReplies) {
    resp_reply r;
    size_t consumed = 0;

    ASSERT_EQ(parse_all("+OK\r\n", r, consumed), RESP_PARSE_OK);
    EXPECT_EQ(r.type, RESP_TYPE_SIMPLE);
    EXPECT_EQ(r.str, "OK");
    EXPECT_EQ(consumed, 5u);

    ASSERT_EQ(parse_all("-ERR wrong number of arguments\r\n", r, consumed), RESP_PARSE_OK);
    EXPECT_EQ(r.type, RESP_TYPE_ERROR);
    EXPECT_EQ(r.str, "ERR wrong number of arguments");

    ASSERT_EQ(parse_all(":-42\r\n", r, consumed), RESP_PARSE_OK);
    EXPECT_EQ(r.type, RESP_TYPE_INTEGER);
    EXPECT_EQ(r.integer, -42);

    ASSERT_EQ(parse_all("$-1\r\n", r, consumed), RESP_PARSE_OK);
    EXPECT_EQ(r.type, RESP_TYPE_NIL);
}

TEST(RedisResp, BulkStringsAreBinarySafe) {
    const std::string wire("$4\r\n\r\n\0\x01\r\n+PONG\r\n", 17);
    resp_reply r;
    size_t consumed = 0;
    ASSERT_EQ(parse_all(wire, r, consumed), RESP_PARSE_OK);
    EXPECT_EQ(r.type, RESP_TYPE_BULK);
    EXPECT_EQ(r.str, std::string("\r\n\0\x01", 4));
    EXPECT_EQ(consumed, 10u);
}

TEST(RedisResp, ParsesNestedArrays) {
    resp_reply r;
    size_t consumed = 0;
    ASSERT_EQ(parse_all("*2\r\n$1\r\na\r\n*1\r\n:7\r\n", r, consumed), RESP_PARSE_OK);
    ASSERT_EQ(r.type, RESP_TYPE_ARRAY);
    ASSERT_EQ(r.elements.size(), 2u);
    EXPECT_EQ(r.elements[0].str, "a");
    ASSERT_EQ(r.elements[1].elements.size(), 1u);
    EXPECT_EQ(r.elements[1].elements[0].integer, 7);
}

TEST(RedisResp, PartialRepliesAreIncomplete) {
    resp_reply r;
    size_t consumed = 0;
    EXPECT_EQ(parse_all("", r, consumed), RESP_PARSE_INCOMPLETE);
    EXPECT_EQ(parse_all("+OK\r", r, consumed), RESP_PARSE_INCOMPLETE);
    EXPECT_EQ(parse_all("$5\r\nab", r, consumed), RESP_PARSE_INCOMPLETE);
    EXPECT_EQ(parse_all("*2\r\n:1\r\n", r, consumed), RESP_PARSE_INCOMPLETE);
}

TEST(RedisResp, MalformedRepliesAreErrors) {
    resp_reply r;
    size_t consumed = 0;
    EXPECT_EQ(parse_all("?what\r\n", r, consumed), RESP_PARSE_ERROR);
    EXPECT_EQ(parse_all(":12x\r\n", r, consumed), RESP_PARSE_ERROR);
    EXPECT_EQ(parse_all("$3\r\nabcXY", r, consumed), RESP_PARSE_ERROR);
    EXPECT_EQ(parse_all("$-7\r\n", r, consumed), RESP_PARSE_ERROR);
}

static redis_params unreachable_params() {
    redis_params p;
    // Port 1 on loopback has no listener.
    p.host = "127.0.0.1";
    p.port = 1;
    p.timeout_ms = 200;
    return p;
}

TEST(RedisCacheStore, UnreachableServerFailsFast) {
    redis_cache_store store(unreachable_params());

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<uint8_t> value;
    bool found = true;
    std::string err;
    EXPECT_FALSE(store.get("tts:x", value, found, err));
    EXPECT_FALSE(found);
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(store.set("tts:x", {1, 2}, 60, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(store.ping(err));

    const auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

TEST(RedisCacheStore, UnresolvableHostFails) {
    redis_params p = unreachable_params();
    p.host = "no-such-host.invalid";
    redis_cache_store store(p);
    std::string err;
    EXPECT_FALSE(store.ping(err));
    EXPECT_FALSE(err.empty());
}

TEST(RedisCacheStore, OutageDoesNotFailSynthesis) {
    temp_dir models;
    write_voice_files(models.path, "en_US-test-low");
    stub_engine engine;
    model_registry_params rp;
    rp.models_dir = models.str();
    model_registry registry(rp, engine, nullptr);

    redis_cache_store store(unreachable_params());
    orchestrator_params op;
    op.default_model = "en_US-test-low";
    orchestrator orch(op, registry, engine, &store);

    synthesis_request req;
    req.text = "cache is down";
    req.target_sample_rate = 16000;
    synthesis_result res;
    tts_error err;
    ASSERT_TRUE(orch.handle(req, res, err)) << err.message;
    EXPECT_EQ(res.cache, CACHE_STATUS_ERROR);
    EXPECT_FALSE(res.audio.empty());
    EXPECT_EQ(res.sample_rate, 16000);
}
