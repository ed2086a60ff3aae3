#pragma once

#include "model-source.h"
#include "synthesis-engine.h"
#include "tts-types.h"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum voice_model_state {
    VOICE_MODEL_UNRESOLVED = 0,
    VOICE_MODEL_RESOLVING,
    VOICE_MODEL_READY,
    VOICE_MODEL_FAILED,
};

const char * voice_model_state_to_cstr(voice_model_state state);

// Published once and never mutated afterwards.
struct voice_model {
    std::string id;
    int32_t native_sample_rate = 0;
    std::shared_ptr<const voice_handle> handle;
};

struct voice_model_info {
    std::string id;
    voice_model_state state = VOICE_MODEL_UNRESOLVED;
    int32_t native_sample_rate = 0;
    std::string last_error;
};

struct model_registry_params {
    std::string models_dir = "./assets";
    std::string fallback_dir;                  // searched second, written when models_dir is not writable
    std::vector<std::string> available_models; // empty: any well-formed id
    int32_t max_models = 8;                    // distinct ids tracked at once
};

// Ids become file names: [A-Za-z0-9_.-]{1,128}, no leading '.'.
bool model_id_is_valid(const std::string & id);

class model_registry {
public:
    // `source` may be null, in which case only local voices resolve.
    model_registry(const model_registry_params & params, synthesis_engine & engine, model_source * source);

    model_registry(const model_registry &) = delete;
    model_registry & operator=(const model_registry &) = delete;

    // Blocks while another caller acquires the same id and shares its outcome.
    // Errors are always TTS_ERROR_MODEL_UNAVAILABLE; `not_found` is set when the
    // id is not permitted or the source does not have it.
    bool resolve(const std::string & model_id, std::shared_ptr<const voice_model> & out, tts_error & err);

    voice_model_state state(const std::string & model_id) const;
    std::vector<voice_model_info> snapshot() const;

    // Returns the number of ids that ended up ready.
    size_t preload(const std::vector<std::string> & ids);

    bool is_permitted(const std::string & model_id) const;

    const model_registry_params & params() const { return params_; }

private:
    struct entry {
        std::mutex mtx;
        std::condition_variable cv;
        voice_model_state state = VOICE_MODEL_UNRESOLVED;
        uint64_t generation = 0; // bumped when an acquisition attempt finishes
        std::shared_ptr<const voice_model> model;
        tts_error last_error;
    };

    bool lookup_or_insert(const std::string & model_id, std::shared_ptr<entry> & out, tts_error & err);
    void prune_failed_locked();

    bool acquire(const std::string & model_id, std::shared_ptr<const voice_model> & out, tts_error & err);
    bool find_local(const std::string & model_id, voice_files & out) const;
    bool fetch_remote(const std::string & model_id, voice_files & out, tts_error & err);
    std::string writable_dir() const;

    model_registry_params params_;
    synthesis_engine & engine_;
    model_source * source_;

    mutable std::shared_mutex table_mtx_;
    std::map<std::string, std::shared_ptr<entry>> table_;
};
