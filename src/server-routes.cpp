#include "server-routes.h"

#include "tts-log.h"

#include <httplib.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

static const char * k_json_content_type = "application/json; charset=utf-8";
static const char * k_user_token_header = "user-token";

static bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

static bool get_json_positive_i32(const json & j, const char * key, int32_t & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number_integer()) {
        throw std::runtime_error(std::string("field '") + key + "' must be an integer");
    }
    const int64_t v = it->get<int64_t>();
    if (v <= 0 || v > INT32_MAX) {
        throw std::runtime_error(std::string("field '") + key + "' must be a positive integer");
    }
    out = (int32_t) v;
    return true;
}

bool parse_synthesize_body(const std::string & body, synthesis_request & out, std::string & err) {
    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception & e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "request body must be a JSON object";
        return false;
    }

    out = synthesis_request();
    try {
        if (!get_json_string(j, "text", out.text)) {
            err = "field 'text' is required";
            return false;
        }
        get_json_string(j, "model", out.model_id);
        if (!get_json_positive_i32(j, "sampleRate", out.target_sample_rate) &&
                !get_json_positive_i32(j, "sample_rate", out.target_sample_rate)) {
            get_json_positive_i32(j, "samplerate", out.target_sample_rate);
        }
    } catch (const std::exception & e) {
        err = e.what();
        return false;
    }
    return true;
}

int tts_error_http_status(const tts_error & err) {
    switch (err.kind) {
        case TTS_ERROR_INVALID_REQUEST:
            return 400;
        case TTS_ERROR_MODEL_UNAVAILABLE:
            return err.not_found ? 404 : 500;
        case TTS_ERROR_SYNTHESIS_FAILED:
        case TTS_ERROR_NONE:
            break;
    }
    return 500;
}

json make_error_json(const std::string & detail) {
    return json {
        {"detail", detail},
    };
}

std::string pcm_content_type(int32_t sample_rate) {
    return "audio/x-raw; format=S16LE; channels=1; rate=" + std::to_string(sample_rate);
}

static std::string format_ms_header(double ms) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1fms", ms);
    return buf;
}

static double ms_since(const std::chrono::steady_clock::time_point & t0) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

void install_routes(
        httplib::Server & server,
        const server_config & cfg,
        orchestrator & orch,
        model_registry & registry) {
    server.set_default_headers({{"Server", "tts-batch-server"}});

    const std::string token = cfg.user_token;
    server.set_pre_routing_handler([token](const httplib::Request & req, httplib::Response & res) {
        if (token.empty() || req.path == "/health") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (req.get_header_value(k_user_token_header) != token) {
            res.status = 403;
            res.set_content(make_error_json("forbidden").dump(), k_json_content_type);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.set_exception_handler([](const httplib::Request & req, httplib::Response & res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception & e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        TTS_LOG_ERROR("%s %s: unhandled exception: %s\n", req.method.c_str(), req.path.c_str(), what.c_str());
        res.status = 500;
        res.set_content(make_error_json("internal server error").dump(), k_json_content_type);
    });

    server.Get("/health", [&orch](const httplib::Request &, httplib::Response & res) {
        json j = {
            {"status", "healthy"},
            {"inflight", orch.inflight()},
        };
        res.set_content(j.dump(), k_json_content_type);
    });

    server.Get("/models", [&orch, &registry](const httplib::Request &, httplib::Response & res) {
        json models = json::array();
        for (const voice_model_info & info : registry.snapshot()) {
            json m = {
                {"id", info.id},
                {"state", voice_model_state_to_cstr(info.state)},
            };
            if (info.native_sample_rate > 0) {
                m["native_sample_rate"] = info.native_sample_rate;
            }
            if (!info.last_error.empty()) {
                m["error"] = info.last_error;
            }
            models.push_back(m);
        }
        json j = {
            {"default_model", orch.params().default_model},
            {"available_models", registry.params().available_models},
            {"models", models},
        };
        res.set_content(j.dump(), k_json_content_type);
    });

    auto synthesize_handler = [&orch](const httplib::Request & req, httplib::Response & res) {
        const auto t0 = std::chrono::steady_clock::now();

        synthesis_request sreq;
        std::string perr;
        if (!parse_synthesize_body(req.body, sreq, perr)) {
            res.status = 400;
            res.set_content(make_error_json(perr).dump(), k_json_content_type);
            TTS_LOG_INFO("synthesize: path=%s ok=false status=400 total_ms=%.2f err=%s\n",
                    req.path.c_str(), ms_since(t0), perr.c_str());
            return;
        }

        synthesis_result result;
        tts_error err;
        if (!orch.handle(sreq, result, err)) {
            const int status = tts_error_http_status(err);
            res.status = status;
            res.set_content(make_error_json(err.message).dump(), k_json_content_type);
            TTS_LOG_INFO("synthesize: path=%s ok=false status=%d kind=%s model=%s total_ms=%.2f err=%s\n",
                    req.path.c_str(), status, tts_error_kind_to_cstr(err.kind),
                    sreq.model_id.empty() ? "default" : sreq.model_id.c_str(),
                    ms_since(t0), err.message.c_str());
            return;
        }

        res.status = 200;
        res.set_header("X-Model", result.model_id);
        res.set_header("X-Sample-Rate", std::to_string(result.sample_rate));
        res.set_header("X-Cache", cache_status_to_cstr(result.cache));
        res.set_header("X-Resampling", result.resampled ? "APPLIED" : "NONE");
        if (result.cache != CACHE_STATUS_HIT) {
            res.set_header("X-Synthesis-Time", format_ms_header(result.synth_ms));
            res.set_header("X-Resample-Time", format_ms_header(result.resample_ms));
        }
        res.set_header("X-Total-Time", format_ms_header(result.total_ms));
        res.set_content(
                reinterpret_cast<const char *>(result.audio.data()),
                result.audio.size(),
                pcm_content_type(result.sample_rate));

        TTS_LOG_INFO("synthesize: path=%s ok=true cache=%s model=%s native=%d target=%d bytes=%zu coalesced=%s "
                "synth_ms=%.2f resample_ms=%.2f total_ms=%.2f\n",
                req.path.c_str(), cache_status_to_cstr(result.cache), result.model_id.c_str(),
                result.native_sample_rate, result.sample_rate, result.audio.size(),
                result.coalesced ? "true" : "false",
                result.synth_ms, result.resample_ms, ms_since(t0));
    };

    server.Post("/synthesize", synthesize_handler);
    server.Post("/synthesizeSpeech", synthesize_handler);
}
