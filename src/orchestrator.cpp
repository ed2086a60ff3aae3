#include "orchestrator.h"

#include "cache-key.h"
#include "pcm-audio.h"
#include "resampler.h"
#include "tts-log.h"

#include <chrono>

namespace {

double ms_since(const std::chrono::steady_clock::time_point & t0) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

size_t utf8_length(const std::string & s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

struct inflight_guard {
    std::atomic<int32_t> & counter;
    explicit inflight_guard(std::atomic<int32_t> & c) : counter(c) { counter++; }
    ~inflight_guard() { counter--; }
};

} // namespace

orchestrator::orchestrator(
        const orchestrator_params & params,
        model_registry & registry,
        const synthesis_engine & engine,
        cache_store * cache)
    : params_(params), registry_(registry), engine_(engine), cache_(cache) {
}

bool orchestrator::validate(const synthesis_request & req, std::string & model_id, tts_error & err) const {
    if (req.text.empty()) {
        tts_error_set(err, TTS_ERROR_INVALID_REQUEST, "text must not be empty");
        return false;
    }
    if (params_.max_text_length > 0 && utf8_length(req.text) > (size_t) params_.max_text_length) {
        tts_error_set(err, TTS_ERROR_INVALID_REQUEST,
                "text exceeds " + std::to_string(params_.max_text_length) + " characters");
        return false;
    }
    // 0 means unset and selects the native rate.
    if (req.target_sample_rate < 0 || req.target_sample_rate > params_.max_sample_rate) {
        tts_error_set(err, TTS_ERROR_INVALID_REQUEST,
                "sampleRate must be a positive integer no greater than " + std::to_string(params_.max_sample_rate));
        return false;
    }

    model_id = req.model_id.empty() ? params_.default_model : req.model_id;
    if (!model_id_is_valid(model_id)) {
        tts_error_set(err, TTS_ERROR_INVALID_REQUEST, "invalid model id: " + model_id);
        return false;
    }
    return true;
}

bool orchestrator::handle(const synthesis_request & req, synthesis_result & out, tts_error & err) {
    const auto t0 = std::chrono::steady_clock::now();
    inflight_guard guard(inflight_);

    std::string model_id;
    if (!validate(req, model_id, err)) {
        return false;
    }

    // Without an explicit rate the key depends on the native rate, which only
    // the resolved model knows.
    std::shared_ptr<const voice_model> model;
    int32_t target_rate = req.target_sample_rate;
    if (target_rate == 0) {
        if (!registry_.resolve(model_id, model, err)) {
            return false;
        }
        target_rate = model->native_sample_rate;
    }

    std::string key = cache_key_derive(model_id, req.text, target_rate);

    out = synthesis_result();
    out.model_id = model_id;
    out.sample_rate = target_rate;
    out.cache = CACHE_STATUS_DISABLED;

    // Never share one fallback key between requests.
    if (!cache_key_is_valid(key)) {
        TTS_LOG_ERROR("cache: key derivation failed for model %s, bypassing cache\n", model_id.c_str());
        key.clear();
        if (cache_ != nullptr) {
            out.cache = CACHE_STATUS_ERROR;
        }
    } else if (cache_ != nullptr) {
        bool found = false;
        std::vector<uint8_t> cached;
        std::string cache_err;
        if (!cache_->get(key, cached, found, cache_err)) {
            TTS_LOG_WARN("cache: %s lookup failed: %s\n", cache_->name(), cache_err.c_str());
            out.cache = CACHE_STATUS_ERROR;
        } else if (found) {
            out.audio = std::move(cached);
            out.cache = CACHE_STATUS_HIT;
            if (model) {
                out.native_sample_rate = model->native_sample_rate;
            }
            out.total_ms = ms_since(t0);
            return true;
        } else {
            out.cache = CACHE_STATUS_MISS;
        }
    }

    const bool ok = params_.coalesce && !key.empty()
            ? produce_coalesced(req, model_id, target_rate, key, model, out, err)
            : produce(req, model_id, target_rate, key, model, out, err);
    out.total_ms = ms_since(t0);
    return ok;
}

bool orchestrator::produce(
        const synthesis_request & req,
        const std::string & model_id,
        int32_t target_rate,
        const std::string & key,
        std::shared_ptr<const voice_model> model,
        synthesis_result & out,
        tts_error & err) {
    if (!model && !registry_.resolve(model_id, model, err)) {
        return false;
    }
    out.native_sample_rate = model->native_sample_rate;

    const auto t_synth = std::chrono::steady_clock::now();
    std::vector<int16_t> pcm;
    std::string engine_err;
    if (!engine_.synthesize(*model->handle, req.text, pcm, engine_err)) {
        TTS_LOG_ERROR("synthesis failed for model %s: %s\n", model_id.c_str(), engine_err.c_str());
        tts_error_set(err, TTS_ERROR_SYNTHESIS_FAILED, "audio synthesis failed: " + engine_err);
        return false;
    }
    out.synth_ms = ms_since(t_synth);

    if (target_rate != model->native_sample_rate) {
        const auto t_resample = std::chrono::steady_clock::now();
        std::vector<int16_t> resampled;
        std::string resample_err;
        if (!resample_pcm16(pcm, model->native_sample_rate, target_rate, resampled, resample_err)) {
            tts_error_set(err, TTS_ERROR_SYNTHESIS_FAILED, "resampling failed: " + resample_err);
            return false;
        }
        pcm.swap(resampled);
        out.resampled = true;
        out.resample_ms = ms_since(t_resample);
    }

    out.audio = pcm16_to_bytes(pcm);

    if (cache_ != nullptr && !key.empty()) {
        std::string cache_err;
        if (!cache_->set(key, out.audio, params_.cache_ttl_sec, cache_err)) {
            TTS_LOG_WARN("cache: %s store failed: %s\n", cache_->name(), cache_err.c_str());
        }
    }
    return true;
}

bool orchestrator::produce_coalesced(
        const synthesis_request & req,
        const std::string & model_id,
        int32_t target_rate,
        const std::string & key,
        std::shared_ptr<const voice_model> model,
        synthesis_result & out,
        tts_error & err) {
    std::shared_ptr<flight> f;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(flights_mtx_);
        auto it = flights_.find(key);
        if (it == flights_.end()) {
            f = std::make_shared<flight>();
            flights_.emplace(key, f);
            leader = true;
        } else {
            f = it->second;
        }
    }

    if (!leader) {
        std::unique_lock<std::mutex> lock(flights_mtx_);
        flights_cv_.wait(lock, [&]() { return f->done; });
        if (!f->ok) {
            err = f->err;
            return false;
        }
        const cache_status observed = out.cache;
        out = f->result;
        out.cache = observed;
        out.coalesced = true;
        return true;
    }

    auto land = [&](bool ok) {
        {
            std::lock_guard<std::mutex> lock(flights_mtx_);
            f->done = true;
            f->ok = ok;
            if (ok) {
                f->result = out;
            } else {
                f->err = err;
            }
            flights_.erase(key);
        }
        flights_cv_.notify_all();
    };

    bool ok = false;
    try {
        ok = produce(req, model_id, target_rate, key, model, out, err);
    } catch (...) {
        // Followers get a failure; the leader's caller still sees the exception.
        tts_error_set(err, TTS_ERROR_SYNTHESIS_FAILED, "audio synthesis aborted");
        land(false);
        throw;
    }
    land(ok);
    return ok;
}
