#include "model-registry.h"
#include "test-stubs.h"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct registry_fixture {
    temp_dir models;
    temp_dir fallback;
    stub_engine engine;
    stub_model_source source;

    model_registry_params params() const {
        model_registry_params p;
        p.models_dir = models.str();
        p.fallback_dir = fallback.str();
        p.available_models.clear();
        p.max_models = 8;
        return p;
    }
};

size_t count_entries(const fs::path & dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return 0;
    }
    size_t n = 0;
    for (auto it = fs::directory_iterator(dir, ec); it != fs::directory_iterator(); ++it) {
        ++n;
    }
    return n;
}

} // namespace

TEST(ModelId, Validation) {
    EXPECT_TRUE(model_id_is_valid("en_US-ryan-medium"));
    EXPECT_TRUE(model_id_is_valid("a"));
    EXPECT_TRUE(model_id_is_valid("voice.v2"));
    EXPECT_FALSE(model_id_is_valid(""));
    EXPECT_FALSE(model_id_is_valid(".hidden"));
    EXPECT_FALSE(model_id_is_valid("../etc/passwd"));
    EXPECT_FALSE(model_id_is_valid("a/b"));
    EXPECT_FALSE(model_id_is_valid("a b"));
    EXPECT_FALSE(model_id_is_valid(std::string(129, 'a')));
    EXPECT_TRUE(model_id_is_valid(std::string(128, 'a')));
}

TEST(ModelRegistry, ConcurrentResolvesShareOneFetch) {
    registry_fixture fx;
    fx.source.delay_ms = 150;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    const int n_threads = 20;
    std::atomic<bool> go {false};
    std::atomic<int> n_ok {0};
    std::vector<std::shared_ptr<const voice_model>> models(n_threads);
    std::vector<std::thread> threads;
    for (int i = 0; i < n_threads; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            tts_error err;
            if (reg.resolve("en_US-test-medium", models[i], err)) {
                n_ok++;
            }
        });
    }
    go = true;
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(n_ok.load(), n_threads);
    EXPECT_EQ(fx.source.n_fetch.load(), 1);
    EXPECT_EQ(fx.engine.n_load.load(), 1);
    for (int i = 1; i < n_threads; ++i) {
        EXPECT_EQ(models[i].get(), models[0].get());
    }
    EXPECT_EQ(models[0]->native_sample_rate, 22050);
    EXPECT_EQ(reg.state("en_US-test-medium"), VOICE_MODEL_READY);
}

TEST(ModelRegistry, ConcurrentWaitersShareFailure) {
    registry_fixture fx;
    fx.source.delay_ms = 200;
    fx.source.status = MODEL_FETCH_FAILED;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    const int n_threads = 10;
    std::atomic<bool> go {false};
    std::atomic<int> n_failed {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < n_threads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            std::shared_ptr<const voice_model> model;
            tts_error err;
            if (!reg.resolve("en_US-test-medium", model, err)) {
                EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
                n_failed++;
            }
        });
    }
    go = true;
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(n_failed.load(), n_threads);
    EXPECT_EQ(fx.source.n_fetch.load(), 1);
}

TEST(ModelRegistry, LocalVoiceIsNotFetched) {
    registry_fixture fx;
    write_voice_files(fx.models.path, "en_US-local-low");
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-local-low", model, err)) << err.message;
    EXPECT_EQ(fx.source.n_fetch.load(), 0);
    EXPECT_EQ(model->id, "en_US-local-low");

    // Second resolve is served from the table.
    ASSERT_TRUE(reg.resolve("en_US-local-low", model, err));
    EXPECT_EQ(fx.engine.n_load.load(), 1);
}

TEST(ModelRegistry, FallbackDirIsSearched) {
    registry_fixture fx;
    write_voice_files(fx.fallback.path, "en_US-home-low");
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-home-low", model, err)) << err.message;
    EXPECT_EQ(fx.source.n_fetch.load(), 0);
    EXPECT_EQ(fs::path(fx.engine.last_model_path).parent_path(), fx.fallback.path);
}

TEST(ModelRegistry, HalfPublishedVoiceIsRefetched) {
    registry_fixture fx;
    std::ofstream(fx.models.path / "en_US-half-low.onnx") << "partial";
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-half-low", model, err)) << err.message;
    EXPECT_EQ(fx.source.n_fetch.load(), 1);
}

TEST(ModelRegistry, FetchPublishesAndCleansStaging) {
    registry_fixture fx;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-new-medium", model, err)) << err.message;

    EXPECT_TRUE(fs::is_regular_file(fx.models.path / "en_US-new-medium.onnx"));
    EXPECT_TRUE(fs::is_regular_file(fx.models.path / "en_US-new-medium.onnx.json"));
    EXPECT_EQ(fx.engine.last_model_path, (fx.models.path / "en_US-new-medium.onnx").string());
    EXPECT_FALSE(fs::exists(fx.source.last_staging_dir));
    EXPECT_EQ(count_entries(fx.models.path / ".staging"), 0u);
}

TEST(ModelRegistry, FailedFetchIsRetryable) {
    registry_fixture fx;
    fx.source.status = MODEL_FETCH_FAILED;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("en_US-flaky-low", model, err));
    EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
    EXPECT_FALSE(err.not_found);
    EXPECT_EQ(reg.state("en_US-flaky-low"), VOICE_MODEL_FAILED);
    EXPECT_EQ(count_entries(fx.models.path / ".staging"), 0u);
    EXPECT_FALSE(fs::exists(fx.models.path / "en_US-flaky-low.onnx"));

    fx.source.status = MODEL_FETCH_OK;
    err = tts_error();
    ASSERT_TRUE(reg.resolve("en_US-flaky-low", model, err)) << err.message;
    EXPECT_EQ(reg.state("en_US-flaky-low"), VOICE_MODEL_READY);
    EXPECT_EQ(fx.source.n_fetch.load(), 2);
}

TEST(ModelRegistry, UnknownModelIsNotFound) {
    registry_fixture fx;
    fx.source.status = MODEL_FETCH_NOT_FOUND;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("xx_XX-nobody-low", model, err));
    EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
    EXPECT_TRUE(err.not_found);
    EXPECT_EQ(reg.state("xx_XX-nobody-low"), VOICE_MODEL_FAILED);
}

TEST(ModelRegistry, LoadFailureIsRetryable) {
    registry_fixture fx;
    write_voice_files(fx.models.path, "en_US-broken-low");
    fx.engine.fail_load = true;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("en_US-broken-low", model, err));
    EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
    EXPECT_FALSE(err.not_found);
    EXPECT_EQ(reg.state("en_US-broken-low"), VOICE_MODEL_FAILED);

    fx.engine.fail_load = false;
    ASSERT_TRUE(reg.resolve("en_US-broken-low", model, err)) << err.message;
    EXPECT_EQ(fx.engine.n_load.load(), 2);
}

TEST(ModelRegistry, AllowListRejectsWithoutFetching) {
    registry_fixture fx;
    model_registry_params p = fx.params();
    p.available_models = {"en_US-allowed-low"};
    model_registry reg(p, fx.engine, &fx.source);

    EXPECT_TRUE(reg.is_permitted("en_US-allowed-low"));
    EXPECT_FALSE(reg.is_permitted("en_US-other-low"));

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("en_US-other-low", model, err));
    EXPECT_TRUE(err.not_found);
    EXPECT_EQ(fx.source.n_fetch.load(), 0);
    EXPECT_EQ(reg.state("en_US-other-low"), VOICE_MODEL_UNRESOLVED);

    ASSERT_TRUE(reg.resolve("en_US-allowed-low", model, err)) << err.message;
}

TEST(ModelRegistry, InvalidIdNeverTouchesDisk) {
    registry_fixture fx;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("../escape", model, err));
    EXPECT_EQ(fx.source.n_fetch.load(), 0);
    EXPECT_EQ(fx.engine.n_load.load(), 0);
}

TEST(ModelRegistry, MaxModelsBoundsDistinctIds) {
    registry_fixture fx;
    model_registry_params p = fx.params();
    p.max_models = 2;
    model_registry reg(p, fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-one-low", model, err));
    ASSERT_TRUE(reg.resolve("en_US-two-low", model, err));
    EXPECT_FALSE(reg.resolve("en_US-three-low", model, err));
    EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
    EXPECT_EQ(fx.source.n_fetch.load(), 2);

    // Already-known ids keep resolving.
    EXPECT_TRUE(reg.resolve("en_US-one-low", model, err));
}

TEST(ModelRegistry, FailedIdsDoNotHoldSlots) {
    registry_fixture fx;
    model_registry_params p = fx.params();
    p.max_models = 1;
    fx.source.status = MODEL_FETCH_NOT_FOUND;
    model_registry reg(p, fx.engine, &fx.source);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_FALSE(reg.resolve("en_US-missing-low", model, err));

    fx.source.status = MODEL_FETCH_OK;
    EXPECT_TRUE(reg.resolve("en_US-present-low", model, err)) << err.message;
}

TEST(ModelRegistry, WithoutSourceOnlyLocalVoicesResolve) {
    registry_fixture fx;
    write_voice_files(fx.models.path, "en_US-local-low");
    model_registry reg(fx.params(), fx.engine, nullptr);

    std::shared_ptr<const voice_model> model;
    tts_error err;
    EXPECT_TRUE(reg.resolve("en_US-local-low", model, err));
    EXPECT_FALSE(reg.resolve("en_US-remote-low", model, err));
    EXPECT_TRUE(err.not_found);
}

TEST(ModelRegistry, SnapshotAndPreload) {
    registry_fixture fx;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    EXPECT_EQ(reg.preload({"en_US-a-low", "en_US-b-low"}), 2u);

    fx.source.status = MODEL_FETCH_FAILED;
    EXPECT_EQ(reg.preload({"en_US-c-low"}), 0u);

    const std::vector<voice_model_info> snap = reg.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    std::set<std::string> ready;
    for (const voice_model_info & info : snap) {
        if (info.state == VOICE_MODEL_READY) {
            ready.insert(info.id);
            EXPECT_EQ(info.native_sample_rate, 22050);
            EXPECT_TRUE(info.last_error.empty());
        } else {
            EXPECT_EQ(info.id, "en_US-c-low");
            EXPECT_EQ(info.state, VOICE_MODEL_FAILED);
            EXPECT_FALSE(info.last_error.empty());
        }
    }
    EXPECT_EQ(ready, (std::set<std::string>{"en_US-a-low", "en_US-b-low"}));
}

TEST(ModelRegistry, ThrowingLoadFailsAndReleasesWaiters) {
    registry_fixture fx;
    fx.source.delay_ms = 150;
    fx.engine.throw_load = true;
    model_registry reg(fx.params(), fx.engine, &fx.source);

    const int n_threads = 4;
    std::atomic<int> n_failed {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < n_threads; ++i) {
        threads.emplace_back([&]() {
            std::shared_ptr<const voice_model> m;
            tts_error err;
            if (!reg.resolve("en_US-boom-low", m, err)) {
                EXPECT_EQ(err.kind, TTS_ERROR_MODEL_UNAVAILABLE);
                EXPECT_NE(err.message.find("stub load threw"), std::string::npos);
                n_failed++;
            }
        });
    }
    for (auto & t : threads) {
        t.join();
    }
    EXPECT_EQ(n_failed.load(), n_threads);
    EXPECT_EQ(fx.engine.n_load.load(), 1);
    EXPECT_EQ(reg.state("en_US-boom-low"), VOICE_MODEL_FAILED);

    fx.engine.throw_load = false;
    std::shared_ptr<const voice_model> m;
    tts_error err;
    ASSERT_TRUE(reg.resolve("en_US-boom-low", m, err)) << err.message;
    EXPECT_EQ(reg.state("en_US-boom-low"), VOICE_MODEL_READY);
}

TEST(ModelRegistry, PruningNeverDuplicatesAnInFlightId) {
    registry_fixture fx;
    fx.source.status = MODEL_FETCH_NOT_FOUND;
    fx.source.delay_ms = 2;
    model_registry_params p = fx.params();
    p.max_models = 1;
    model_registry reg(p, fx.engine, &fx.source);

    std::atomic<bool> go {false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int j = 0; j < 40; ++j) {
                std::shared_ptr<const voice_model> m;
                tts_error err;
                reg.resolve("en_US-x-low", m, err);
            }
        });
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int j = 0; j < 40; ++j) {
                std::shared_ptr<const voice_model> m;
                tts_error err;
                reg.resolve("en_US-f" + std::to_string(i) + "x" + std::to_string(j) + "-low", m, err);
            }
        });
    }
    go = true;
    for (auto & t : threads) {
        t.join();
    }

    EXPECT_EQ(fx.source.max_active_per_id, 1);
    EXPECT_LE(reg.snapshot().size(), 1u);
}
