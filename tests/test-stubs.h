#pragma once

#include "cache-store.h"
#include "memory-cache-store.h"
#include "model-source.h"
#include "synthesis-engine.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

// Engine that "loads" any file pair and emits a deterministic ramp, 100
// samples per input byte, at a fixed native rate.
class stub_engine : public synthesis_engine {
public:
    struct voice : public voice_handle {
        int32_t rate = 0;
    };

    explicit stub_engine(int32_t native_rate = 22050) : native_rate(native_rate) {}

    bool load_voice(
            const voice_files & files,
            std::shared_ptr<const voice_handle> & out,
            int32_t & native_sample_rate,
            std::string & err) override {
        n_load++;
        last_model_path = files.model_path;
        if (throw_load) {
            throw std::runtime_error("stub load threw");
        }
        if (fail_load) {
            err = "stub load failure";
            return false;
        }
        auto v = std::make_shared<voice>();
        v->rate = native_rate;
        out = v;
        native_sample_rate = native_rate;
        return true;
    }

    bool synthesize(
            const voice_handle & /* handle */,
            const std::string & text,
            std::vector<int16_t> & pcm,
            std::string & err) const override {
        n_synth++;
        if (synth_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(synth_delay_ms));
        }
        if (throw_synth) {
            throw std::bad_alloc();
        }
        if (fail_synth) {
            err = "stub synthesis failure";
            return false;
        }
        pcm.resize(text.size() * 100);
        for (size_t i = 0; i < pcm.size(); ++i) {
            pcm[i] = (int16_t) ((i % 200) * 100 - 10000);
        }
        return true;
    }

    const char * name() const override { return "stub"; }

    int32_t native_rate;
    std::atomic<bool> fail_load {false};
    std::atomic<bool> fail_synth {false};
    std::atomic<bool> throw_load {false};
    std::atomic<bool> throw_synth {false};
    int synth_delay_ms = 0;
    std::string last_model_path;

    mutable std::atomic<int> n_load {0};
    mutable std::atomic<int> n_synth {0};
};

// Writes placeholder voice files into the staging directory.
class stub_model_source : public model_source {
public:
    model_fetch_status fetch(
            const std::string & model_id,
            const std::string & staging_dir,
            voice_files & out,
            std::string & err) override {
        n_fetch++;
        {
            std::lock_guard<std::mutex> lock(mtx);
            last_staging_dir = staging_dir;
            const int n = ++active[model_id];
            max_active_per_id = std::max(max_active_per_id, n);
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        {
            std::lock_guard<std::mutex> lock(mtx);
            --active[model_id];
        }
        if (status != MODEL_FETCH_OK) {
            err = status == MODEL_FETCH_NOT_FOUND ? "no such voice" : "connection reset";
            return status;
        }
        const std::filesystem::path dir(staging_dir);
        out.model_path = (dir / (model_id + ".onnx")).string();
        out.config_path = (dir / (model_id + ".onnx.json")).string();
        std::ofstream(out.model_path) << "onnx";
        std::ofstream(out.config_path) << "{}";
        return MODEL_FETCH_OK;
    }

    std::atomic<int> n_fetch {0};
    std::atomic<model_fetch_status> status {MODEL_FETCH_OK};
    int delay_ms = 0;
    std::string last_staging_dir;

    // Most fetches of a single id observed running at once.
    std::mutex mtx;
    std::map<std::string, int> active;
    int max_active_per_id = 0;
};

// Every call fails, as a cache whose backend is down.
class failing_cache_store : public cache_store {
public:
    bool get(const std::string &, std::vector<uint8_t> &, bool & found, std::string & err) override {
        n_get++;
        found = false;
        err = "connection refused";
        return false;
    }
    bool set(const std::string &, const std::vector<uint8_t> &, int32_t, std::string & err) override {
        n_set++;
        err = "connection refused";
        return false;
    }
    const char * name() const override { return "failing"; }

    std::atomic<int> n_get {0};
    std::atomic<int> n_set {0};
};

// Memory store with call counters and an optional write failure.
class counting_cache_store : public cache_store {
public:
    bool get(const std::string & key, std::vector<uint8_t> & value, bool & found, std::string & err) override {
        n_get++;
        return inner.get(key, value, found, err);
    }
    bool set(const std::string & key, const std::vector<uint8_t> & value, int32_t ttl_sec, std::string & err) override {
        n_set++;
        last_ttl = ttl_sec;
        if (fail_set) {
            err = "write rejected";
            return false;
        }
        return inner.set(key, value, ttl_sec, err);
    }
    const char * name() const override { return "counting"; }

    memory_cache_store inner;
    std::atomic<int> n_get {0};
    std::atomic<int> n_set {0};
    std::atomic<bool> fail_set {false};
    int32_t last_ttl = 0;
};

struct temp_dir {
    std::filesystem::path path;

    temp_dir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
                ("tts-batch-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

inline void write_voice_files(const std::filesystem::path & dir, const std::string & model_id) {
    std::filesystem::create_directories(dir);
    std::ofstream(dir / (model_id + ".onnx")) << "onnx";
    std::ofstream(dir / (model_id + ".onnx.json")) << "{}";
}
