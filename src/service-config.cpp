#include "service-config.h"

#include "model-registry.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

using json = nlohmann::ordered_json;

bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr || *s == '\0') {
        return false;
    }
    char * end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = (int32_t) v;
    return true;
}

static std::string trim_copy(const std::string & in) {
    size_t b = 0;
    while (b < in.size() && std::isspace((unsigned char) in[b])) {
        ++b;
    }
    size_t e = in.size();
    while (e > b && std::isspace((unsigned char) in[e - 1])) {
        --e;
    }
    return in.substr(b, e - b);
}

static std::string to_lower_copy(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char) std::tolower(c); });
    return v;
}

bool parse_csv_list(const std::string & raw, std::vector<std::string> & out) {
    out.clear();
    size_t start = 0;
    while (start <= raw.size()) {
        const size_t comma = raw.find(',', start);
        const size_t end = comma == std::string::npos ? raw.size() : comma;
        const std::string token = trim_copy(raw.substr(start, end - start));
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return !out.empty();
}

// Accepts `a,b` or a JSON array `["a","b"]`. An empty value clears the list.
static bool parse_model_list(const std::string & raw, std::vector<std::string> & out, std::string & err) {
    const std::string v = trim_copy(raw);
    out.clear();
    if (v.empty()) {
        return true;
    }
    if (v[0] != '[') {
        parse_csv_list(v, out);
        return true;
    }
    try {
        const json arr = json::parse(v);
        if (!arr.is_array()) {
            err = "model list must be a JSON array";
            return false;
        }
        for (const auto & item : arr) {
            if (!item.is_string()) {
                err = "model list entries must be strings";
                return false;
            }
            const std::string id = trim_copy(item.get<std::string>());
            if (!id.empty()) {
                out.push_back(id);
            }
        }
    } catch (const std::exception & e) {
        err = std::string("invalid model list: ") + e.what();
        return false;
    }
    return true;
}

bool parse_on_off_bool(const char * s, bool & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = to_lower_copy(s);
    if (v == "on" || v == "true" || v == "1" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "off" || v == "false" || v == "0" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parse_cache_mode(const char * s, cache_mode & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = to_lower_copy(s);
    if (v == "memory") {
        out = CACHE_MODE_MEMORY;
        return true;
    }
    if (v == "redis") {
        out = CACHE_MODE_REDIS;
        return true;
    }
    bool enabled = false;
    if (!parse_on_off_bool(s, enabled)) {
        return false;
    }
    out = enabled ? CACHE_MODE_REDIS : CACHE_MODE_OFF;
    return true;
}

const char * cache_mode_to_cstr(cache_mode mode) {
    switch (mode) {
        case CACHE_MODE_OFF:    return "off";
        case CACHE_MODE_MEMORY: return "memory";
        case CACHE_MODE_REDIS:  return "redis";
    }
    return "unknown";
}

std::string strip_onnx_suffix(const std::string & name) {
    static const std::string suffix = ".onnx";
    if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return name.substr(0, name.size() - suffix.size());
    }
    return name;
}

static const char * env_value(const char * name) {
    const char * v = std::getenv(name);
    return (v != nullptr && v[0] != '\0') ? v : nullptr;
}

bool service_config_apply_env(service_config & cfg, std::string & err) {
    const char * home = env_value("HOME");
    if (home != nullptr && cfg.fallback_dir.empty()) {
        cfg.fallback_dir = home;
    }

    if (const char * v = env_value("TTS_ASSETS_DIR")) {
        cfg.models_dir = v;
    }
    if (const char * v = std::getenv("TTS_AVAILABLE_MODELS")) {
        if (!parse_model_list(v, cfg.available_models, err)) {
            err = "TTS_AVAILABLE_MODELS: " + err;
            return false;
        }
    }
    if (const char * v = env_value("TTS_DEFAULT_MODEL")) {
        cfg.default_model = v;
    }
    if (const char * v = env_value("TTS_VOICES_URL")) {
        cfg.voices_url = v;
    }
    if (const char * v = env_value("ENABLE_CACHE")) {
        if (!parse_cache_mode(v, cfg.cache)) {
            err = std::string("ENABLE_CACHE: invalid value '") + v + "'";
            return false;
        }
    }
    if (const char * v = env_value("REDIS_HOST")) {
        cfg.redis.host = v;
    }
    if (const char * v = env_value("REDIS_PORT")) {
        if (!parse_i32(v, cfg.redis.port)) {
            err = std::string("REDIS_PORT: invalid value '") + v + "'";
            return false;
        }
    }
    if (const char * v = env_value("REDIS_PASSWORD")) {
        cfg.redis.password = v;
    }
    if (const char * v = env_value("CACHE_TTL")) {
        if (!parse_i32(v, cfg.cache_ttl_sec)) {
            err = std::string("CACHE_TTL: invalid value '") + v + "'";
            return false;
        }
    }
    if (const char * v = env_value("ESPEAK_DATA_PATH")) {
        cfg.espeak_data_path = v;
    }
    if (const char * v = env_value("LOG_LEVEL")) {
        if (!tts_log_parse_level(v, cfg.log_level)) {
            err = std::string("LOG_LEVEL: invalid value '") + v + "'";
            return false;
        }
    }
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

int parse_service_flag(int argc, char ** argv, int & i, service_config & cfg, std::string & err) {
    const std::string arg = argv[i];

    auto bad = [&]() {
        err = "invalid or missing value for " + arg;
        return -1;
    };

    if (arg == "--models-dir") {
        if (!needs_value(i, argc)) return bad();
        cfg.models_dir = argv[++i];
    } else if (arg == "--fallback-dir") {
        if (!needs_value(i, argc)) return bad();
        cfg.fallback_dir = argv[++i];
    } else if (arg == "--models") {
        if (!needs_value(i, argc)) return bad();
        if (!parse_model_list(argv[++i], cfg.available_models, err)) return -1;
    } else if (arg == "--default-model") {
        if (!needs_value(i, argc)) return bad();
        cfg.default_model = argv[++i];
    } else if (arg == "--max-models") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.max_models)) return bad();
    } else if (arg == "--voices-url") {
        if (!needs_value(i, argc)) return bad();
        cfg.voices_url = argv[++i];
    } else if (arg == "--download-timeout") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.download_timeout_sec)) return bad();
    } else if (arg == "--preload") {
        if (!needs_value(i, argc) || !parse_on_off_bool(argv[++i], cfg.preload)) return bad();
    } else if (arg == "--max-text-length") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.max_text_length)) return bad();
    } else if (arg == "--max-sample-rate") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.max_sample_rate)) return bad();
    } else if (arg == "--cache") {
        if (!needs_value(i, argc) || !parse_cache_mode(argv[++i], cfg.cache)) return bad();
    } else if (arg == "--redis-host") {
        if (!needs_value(i, argc)) return bad();
        cfg.redis.host = argv[++i];
    } else if (arg == "--redis-port") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.redis.port)) return bad();
    } else if (arg == "--redis-password") {
        if (!needs_value(i, argc)) return bad();
        cfg.redis.password = argv[++i];
    } else if (arg == "--redis-db") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.redis.db)) return bad();
    } else if (arg == "--redis-timeout-ms") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.redis.timeout_ms)) return bad();
    } else if (arg == "--cache-ttl") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.cache_ttl_sec)) return bad();
    } else if (arg == "--coalesce") {
        if (!needs_value(i, argc) || !parse_on_off_bool(argv[++i], cfg.coalesce)) return bad();
    } else if (arg == "--espeak-data") {
        if (!needs_value(i, argc)) return bad();
        cfg.espeak_data_path = argv[++i];
    } else if (arg == "--threads") {
        if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_threads)) return bad();
    } else if (arg == "--log-level") {
        if (!needs_value(i, argc) || !tts_log_parse_level(argv[++i], cfg.log_level)) return bad();
    } else {
        return 0;
    }
    return 1;
}

bool service_config_finalize(service_config & cfg, std::string & err) {
    cfg.default_model = strip_onnx_suffix(cfg.default_model);
    for (std::string & id : cfg.available_models) {
        id = strip_onnx_suffix(id);
    }

    if (!model_id_is_valid(cfg.default_model)) {
        err = "invalid default model id: " + cfg.default_model;
        return false;
    }
    for (const std::string & id : cfg.available_models) {
        if (!model_id_is_valid(id)) {
            err = "invalid model id in model list: " + id;
            return false;
        }
    }
    if (!cfg.available_models.empty() &&
            std::find(cfg.available_models.begin(), cfg.available_models.end(), cfg.default_model) == cfg.available_models.end()) {
        err = "default model '" + cfg.default_model + "' is not in the model list";
        return false;
    }
    if (cfg.max_models < 1) {
        err = "--max-models must be >= 1";
        return false;
    }
    if ((int32_t) cfg.available_models.size() > cfg.max_models) {
        err = "model list has more entries than --max-models";
        return false;
    }
    if (cfg.download_timeout_sec < 1) {
        err = "--download-timeout must be >= 1";
        return false;
    }
    if (cfg.max_text_length < 1) {
        err = "--max-text-length must be >= 1";
        return false;
    }
    if (cfg.max_sample_rate < 1) {
        err = "--max-sample-rate must be >= 1";
        return false;
    }
    if (cfg.cache_ttl_sec < 1) {
        err = "cache TTL must be >= 1 second";
        return false;
    }
    if (cfg.redis.port < 1 || cfg.redis.port > 65535) {
        err = "redis port out of range";
        return false;
    }
    if (cfg.redis.db < 0) {
        err = "--redis-db must be >= 0";
        return false;
    }
    if (cfg.redis.timeout_ms < 1) {
        err = "--redis-timeout-ms must be >= 1";
        return false;
    }
    if (cfg.n_threads < 0) {
        err = "--threads must be >= 0";
        return false;
    }
    return true;
}

bool parse_server_args(int argc, char ** argv, server_config & cfg, std::string & err) {
    if (!service_config_apply_env(cfg.service, err)) {
        return false;
    }
    if (const char * v = env_value("ALLOWED_USER_TOKEN")) {
        cfg.user_token = v;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const int rc = parse_service_flag(argc, argv, i, cfg.service, err);
        if (rc < 0) {
            return false;
        }
        if (rc > 0) {
            continue;
        }

        if (arg == "--host") {
            if (!needs_value(i, argc)) {
                err = "missing value for --host";
                return false;
            }
            cfg.host = argv[++i];
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.port)) {
                err = "invalid or missing value for --port";
                return false;
            }
        } else if (arg == "--http-threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_http_threads)) {
                err = "invalid or missing value for --http-threads";
                return false;
            }
        } else if (arg == "--user-token") {
            if (!needs_value(i, argc)) {
                err = "missing value for --user-token";
                return false;
            }
            cfg.user_token = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }

    if (cfg.port < 1 || cfg.port > 65535) {
        err = "--port out of range";
        return false;
    }
    if (cfg.n_http_threads < 1) {
        err = "--http-threads must be >= 1";
        return false;
    }
    return service_config_finalize(cfg.service, err);
}

void print_service_usage() {
    std::fprintf(stderr,
        "Voices:\n"
        "  --models-dir DIR                voice directory (env TTS_ASSETS_DIR, default: ./assets)\n"
        "  --fallback-dir DIR              second voice directory (default: $HOME)\n"
        "  --models LIST                   permitted voice ids, comma separated or JSON array\n"
        "                                  (env TTS_AVAILABLE_MODELS, empty: any id)\n"
        "  --default-model ID              voice used when a request names none\n"
        "                                  (env TTS_DEFAULT_MODEL, default: en_US-kathleen-low)\n"
        "  --max-models N                  distinct voices tracked at once (default: 8)\n"
        "  --voices-url URL                voice repository base URL (env TTS_VOICES_URL)\n"
        "  --download-timeout N            voice download timeout seconds (default: 120)\n"
        "  --preload on|off                load every permitted voice at startup (default: off)\n"
        "  --espeak-data DIR               espeak-ng data directory (env ESPEAK_DATA_PATH)\n"
        "  --threads N                     inference threads per voice (default: 0, runtime default)\n\n"
        "Requests:\n"
        "  --max-text-length N             max characters per request (default: 5000)\n"
        "  --max-sample-rate N             max requested sample rate (default: 48000)\n\n"
        "Cache:\n"
        "  --cache off|memory|redis        cache backend (env ENABLE_CACHE, default: redis)\n"
        "  --redis-host STR                (env REDIS_HOST, default: localhost)\n"
        "  --redis-port N                  (env REDIS_PORT, default: 6379)\n"
        "  --redis-password STR            (env REDIS_PASSWORD)\n"
        "  --redis-db N                    (default: 0)\n"
        "  --redis-timeout-ms N            connect/read/write timeout (default: 500)\n"
        "  --cache-ttl N                   entry TTL seconds (env CACHE_TTL, default: 604800)\n"
        "  --coalesce on|off               share synthesis between identical concurrent misses (default: off)\n\n"
        "Logging:\n"
        "  --log-level debug|info|warn|error  (env LOG_LEVEL, default: info)\n");
}

void print_server_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [options]\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 127.0.0.1)\n"
        "  --port N                        bind port (default: 8181)\n"
        "  --http-threads N                request handler threads (default: 8)\n"
        "  --user-token STR                required 'user-token' header (env ALLOWED_USER_TOKEN)\n\n",
        argv0);
    print_service_usage();
}
