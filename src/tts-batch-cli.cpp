#include "pcm-audio.h"
#include "service-config.h"
#include "tts-log.h"
#include "tts-service.h"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

struct cli_params {
    std::string prompt;
    std::string prompt_file;
    std::string model;
    int32_t sample_rate = 0;
    std::string output = "output.wav";
    bool download_only = false;
    bool show_help = false;

    service_config service;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -p TEXT [options]\n"
        "  %s --download-only [options]\n\n"
        "Synthesis:\n"
        "  -p, --prompt TEXT               text to synthesize\n"
        "  -f, --prompt-file FNAME         read the text from a file\n"
        "  -m, --model ID                  voice id (default: --default-model)\n"
        "  --sample-rate N                 output sample rate (default: voice native rate)\n"
        "  -o, --output FNAME              .wav gets a RIFF header, anything else is raw S16LE (default: output.wav)\n"
        "  --download-only                 fetch and load every voice in --models, then exit\n\n",
        argv0, argv0);
    print_service_usage();
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool load_text_file(const std::string & path, std::string & out, std::string & err) {
    std::ifstream file(path);
    if (!file) {
        err = "failed to open prompt file: " + path;
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!file.good() && !file.eof()) {
        err = "failed to read prompt file: " + path;
        return false;
    }
    return true;
}

static bool ends_with(const std::string & s, const std::string & suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool parse_args(int argc, char ** argv, cli_params & p, std::string & err) {
    // The cache is opt-in for one-shot runs.
    p.service.cache = CACHE_MODE_OFF;
    if (!service_config_apply_env(p.service, err)) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const int rc = parse_service_flag(argc, argv, i, p.service, err);
        if (rc < 0) {
            return false;
        }
        if (rc > 0) {
            continue;
        }

        if (arg == "-p" || arg == "--prompt") {
            if (!needs_value(i, argc)) return false;
            p.prompt = argv[++i];
        } else if (arg == "-f" || arg == "--prompt-file") {
            if (!needs_value(i, argc)) return false;
            p.prompt_file = argv[++i];
        } else if (arg == "-m" || arg == "--model") {
            if (!needs_value(i, argc)) return false;
            p.model = strip_onnx_suffix(argv[++i]);
        } else if (arg == "--sample-rate") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.sample_rate) || p.sample_rate <= 0) {
                err = "--sample-rate must be a positive integer";
                return false;
            }
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "--download-only") {
            p.download_only = true;
        } else if (arg == "-h" || arg == "--help") {
            p.show_help = true;
            return true;
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }

    if (!p.prompt_file.empty() && !load_text_file(p.prompt_file, p.prompt, err)) {
        return false;
    }
    if (!p.download_only && p.prompt.empty()) {
        err = "either --prompt, --prompt-file or --download-only is required";
        return false;
    }
    return service_config_finalize(p.service, err);
}

int main(int argc, char ** argv) {
    cli_params p;
    std::string err;
    if (!parse_args(argc, argv, p, err)) {
        if (!err.empty()) {
            std::fprintf(stderr, "error: %s\n\n", err.c_str());
        }
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    tts_log_set_level(p.service.log_level);

    // Preloading happens below for --download-only, with a per-voice report.
    p.service.preload = false;

    tts_service svc;
    if (!tts_service_init(svc, p.service, err)) {
        std::fprintf(stderr, "init failed: %s\n", err.c_str());
        return 1;
    }

    if (p.download_only) {
        std::vector<std::string> ids = p.service.available_models;
        if (ids.empty()) {
            ids.push_back(p.service.default_model);
        }
        size_t n_failed = 0;
        for (const std::string & id : ids) {
            std::shared_ptr<const voice_model> model;
            tts_error terr;
            if (svc.registry->resolve(id, model, terr)) {
                std::fprintf(stderr, "ready: %s (%d Hz)\n", id.c_str(), model->native_sample_rate);
            } else {
                std::fprintf(stderr, "failed: %s: %s\n", id.c_str(), terr.message.c_str());
                ++n_failed;
            }
        }
        std::fprintf(stderr, "download: %zu/%zu voices ready\n", ids.size() - n_failed, ids.size());
        return n_failed == 0 ? 0 : 1;
    }

    synthesis_request req;
    req.text = p.prompt;
    req.model_id = p.model;
    req.target_sample_rate = p.sample_rate;

    synthesis_result result;
    tts_error terr;
    if (!svc.orch->handle(req, result, terr)) {
        std::fprintf(stderr, "synthesis failed (%s): %s\n", tts_error_kind_to_cstr(terr.kind), terr.message.c_str());
        return 1;
    }

    const bool wav = ends_with(p.output, ".wav");
    if (!save_pcm16_file(p.output, result.audio, result.sample_rate, wav, err)) {
        std::fprintf(stderr, "failed to write %s: %s\n", p.output.c_str(), err.c_str());
        return 1;
    }

    std::fprintf(stderr, "wrote %s (%s, %zu bytes, %d Hz, model=%s, cache=%s, resampled=%s, total_ms=%.2f)\n",
            p.output.c_str(), wav ? "wav" : "raw", result.audio.size(), result.sample_rate,
            result.model_id.c_str(), cache_status_to_cstr(result.cache),
            result.resampled ? "yes" : "no", result.total_ms);
    return 0;
}
