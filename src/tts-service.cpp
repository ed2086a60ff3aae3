#include "tts-service.h"

#include "memory-cache-store.h"
#include "redis-cache-store.h"
#include "tts-log.h"

tts_service::~tts_service() {
    orch.reset();
    cache.reset();
    registry.reset();
    source.reset();
    engine.reset();
}

bool tts_service_init(tts_service & svc, const service_config & cfg, std::string & err) {
    piper_engine_params ep;
    ep.espeak_data_path = cfg.espeak_data_path;
    ep.n_threads = cfg.n_threads;
    try {
        svc.engine.reset(new piper_engine(ep));
    } catch (const Ort::Exception & e) {
        err = std::string("failed to initialize onnxruntime: ") + e.what();
        return false;
    }

    if (!cfg.voices_url.empty()) {
        parsed_http_url url;
        if (!parse_http_url(cfg.voices_url, url, err)) {
            return false;
        }
        http_model_source_params sp;
        sp.base_url = cfg.voices_url;
        sp.timeout_sec = cfg.download_timeout_sec;
        svc.source.reset(new http_model_source(sp));
    }

    model_registry_params rp;
    rp.models_dir = cfg.models_dir;
    rp.fallback_dir = cfg.fallback_dir;
    rp.available_models = cfg.available_models;
    rp.max_models = cfg.max_models;
    svc.registry.reset(new model_registry(rp, *svc.engine, svc.source.get()));

    switch (cfg.cache) {
        case CACHE_MODE_OFF:
            TTS_LOG_INFO("cache: disabled\n");
            break;
        case CACHE_MODE_MEMORY:
            svc.cache.reset(new memory_cache_store());
            TTS_LOG_INFO("cache: in-process memory store\n");
            break;
        case CACHE_MODE_REDIS:
            {
                auto redis = std::make_unique<redis_cache_store>(cfg.redis);
                std::string ping_err;
                if (redis->ping(ping_err)) {
                    TTS_LOG_INFO("cache: redis %s:%d\n", cfg.redis.host.c_str(), cfg.redis.port);
                } else {
                    // Kept anyway: every call degrades to a miss until redis comes back.
                    TTS_LOG_WARN("cache: redis %s:%d unreachable (%s), continuing\n",
                            cfg.redis.host.c_str(), cfg.redis.port, ping_err.c_str());
                }
                svc.cache = std::move(redis);
            }
            break;
    }

    orchestrator_params op;
    op.default_model = cfg.default_model;
    op.max_text_length = cfg.max_text_length;
    op.max_sample_rate = cfg.max_sample_rate;
    op.cache_ttl_sec = cfg.cache_ttl_sec;
    op.coalesce = cfg.coalesce;
    svc.orch.reset(new orchestrator(op, *svc.registry, *svc.engine, svc.cache.get()));

    if (cfg.preload) {
        std::vector<std::string> ids = cfg.available_models;
        if (ids.empty()) {
            ids.push_back(cfg.default_model);
        }
        const size_t n_ready = svc.registry->preload(ids);
        TTS_LOG_INFO("preload: %zu/%zu voices ready\n", n_ready, ids.size());
    }

    return true;
}
