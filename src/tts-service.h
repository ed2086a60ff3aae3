#pragma once

#include "cache-store.h"
#include "model-registry.h"
#include "model-source.h"
#include "orchestrator.h"
#include "piper-engine.h"
#include "service-config.h"

#include <memory>

// Everything a process needs to answer synthesis requests, owned in
// dependency order so destruction runs front-end first.
struct tts_service {
    std::unique_ptr<piper_engine> engine;
    std::unique_ptr<model_source> source;
    std::unique_ptr<model_registry> registry;
    std::unique_ptr<cache_store> cache;
    std::unique_ptr<orchestrator> orch;

    ~tts_service();
};

bool tts_service_init(tts_service & svc, const service_config & cfg, std::string & err);
