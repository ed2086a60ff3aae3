#pragma once

#include "model-registry.h"
#include "orchestrator.h"
#include "service-config.h"
#include "tts-types.h"

#include <nlohmann/json.hpp>

#include <string>

namespace httplib {
class Server;
}

using json = nlohmann::ordered_json;

// Body of POST /synthesize: `text` (required), `model`, `sampleRate`
// (also `sample_rate` / `samplerate`). A present sampleRate must be a
// positive integer.
bool parse_synthesize_body(const std::string & body, synthesis_request & out, std::string & err);

int tts_error_http_status(const tts_error & err);

json make_error_json(const std::string & detail);

std::string pcm_content_type(int32_t sample_rate);

void install_routes(
        httplib::Server & server,
        const server_config & cfg,
        orchestrator & orch,
        model_registry & registry);
