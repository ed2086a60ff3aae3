#pragma once

#include "redis-cache-store.h"
#include "tts-log.h"

#include <cstdint>
#include <string>
#include <vector>

enum cache_mode {
    CACHE_MODE_OFF = 0,
    CACHE_MODE_MEMORY,
    CACHE_MODE_REDIS,
};

// Settings shared by the server and the CLI.
struct service_config {
    std::string models_dir = "./assets";
    std::string fallback_dir;   // $HOME unless overridden
    std::vector<std::string> available_models = {"en_US-kathleen-low", "en_US-ryan-medium"};
    std::string default_model = "en_US-kathleen-low";
    int32_t max_models = 8;

    std::string voices_url = "https://huggingface.co/rhasspy/piper-voices/resolve/main";
    int32_t download_timeout_sec = 120;
    bool preload = false;

    int32_t max_text_length = 5000;
    int32_t max_sample_rate = 48000;

    cache_mode cache = CACHE_MODE_REDIS;
    redis_params redis;
    int32_t cache_ttl_sec = 604800;
    bool coalesce = false;

    std::string espeak_data_path;
    int32_t n_threads = 0;

    tts_log_level log_level = TTS_LOG_LEVEL_INFO;
};

struct server_config {
    std::string host = "127.0.0.1";
    int32_t port = 8181;
    int32_t n_http_threads = 8;
    std::string user_token;     // empty: no header check

    service_config service;
};

bool parse_i32(const char * s, int32_t & out);
bool parse_on_off_bool(const char * s, bool & out);
bool parse_csv_list(const std::string & raw, std::vector<std::string> & out);
bool parse_cache_mode(const char * s, cache_mode & out);
const char * cache_mode_to_cstr(cache_mode mode);

// `en_US-ryan-medium.onnx` -> `en_US-ryan-medium`.
std::string strip_onnx_suffix(const std::string & name);

// Environment first, flags after: a flag always wins over its variable.
bool service_config_apply_env(service_config & cfg, std::string & err);

// Consumes argv[i] (and its value) when it is a service flag.
// Returns 1 when consumed, 0 when the flag is not a service flag, -1 on a bad value.
int parse_service_flag(int argc, char ** argv, int & i, service_config & cfg, std::string & err);

bool service_config_finalize(service_config & cfg, std::string & err);

bool parse_server_args(int argc, char ** argv, server_config & cfg, std::string & err);

void print_service_usage();
void print_server_usage(const char * argv0);
