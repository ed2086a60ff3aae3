#pragma once

#include "cache-store.h"
#include "model-registry.h"
#include "synthesis-engine.h"
#include "tts-types.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

struct orchestrator_params {
    std::string default_model = "en_US-kathleen-low";
    int32_t max_text_length = 5000;   // in codepoints
    int32_t max_sample_rate = 48000;
    int32_t cache_ttl_sec = 604800;
    bool coalesce = false;            // share one synthesis between identical concurrent misses
};

// Cache-aside synthesis pipeline. The cache is optional (null disables it) and
// its failures never reach the caller.
class orchestrator {
public:
    orchestrator(
            const orchestrator_params & params,
            model_registry & registry,
            const synthesis_engine & engine,
            cache_store * cache);

    orchestrator(const orchestrator &) = delete;
    orchestrator & operator=(const orchestrator &) = delete;

    bool handle(const synthesis_request & req, synthesis_result & out, tts_error & err);

    int32_t inflight() const { return inflight_.load(); }
    const orchestrator_params & params() const { return params_; }

private:
    struct flight {
        bool done = false;
        bool ok = false;
        synthesis_result result;
        tts_error err;
    };

    bool validate(const synthesis_request & req, std::string & model_id, tts_error & err) const;

    bool produce(
            const synthesis_request & req,
            const std::string & model_id,
            int32_t target_rate,
            const std::string & key,
            std::shared_ptr<const voice_model> model,
            synthesis_result & out,
            tts_error & err);

    bool produce_coalesced(
            const synthesis_request & req,
            const std::string & model_id,
            int32_t target_rate,
            const std::string & key,
            std::shared_ptr<const voice_model> model,
            synthesis_result & out,
            tts_error & err);

    orchestrator_params params_;
    model_registry & registry_;
    const synthesis_engine & engine_;
    cache_store * cache_;

    std::atomic<int32_t> inflight_ {0};

    std::mutex flights_mtx_;
    std::condition_variable flights_cv_;
    std::map<std::string, std::shared_ptr<flight>> flights_;
};
