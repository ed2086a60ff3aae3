#pragma once

#include "synthesis-engine.h"

#include <cstdint>
#include <string>

enum model_fetch_status {
    MODEL_FETCH_OK = 0,
    MODEL_FETCH_NOT_FOUND,  // the source has no such model
    MODEL_FETCH_FAILED,     // transport or I/O failure
};

// Where voices come from when they are not on local disk.
class model_source {
public:
    virtual ~model_source() = default;

    // Write `<id>.onnx` and `<id>.onnx.json` into `staging_dir` (which exists
    // and is private to this call) and report their paths in `out`.
    virtual model_fetch_status fetch(
            const std::string & model_id,
            const std::string & staging_dir,
            voice_files & out,
            std::string & err) = 0;
};

struct parsed_http_url {
    bool https = false;
    std::string host;
    int32_t port = 0;
    std::string path = "/";
};

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err);

// `en_US-ryan-medium` -> `en/en_US/ryan/medium/en_US-ryan-medium`.
// Returns false when the id does not follow the `lang_REGION-name-quality` form.
bool piper_voice_remote_stem(const std::string & model_id, std::string & out);

struct http_model_source_params {
    std::string base_url = "https://huggingface.co/rhasspy/piper-voices/resolve/main";
    int32_t timeout_sec = 120;
};

// Piper voice repository layout served over HTTP(S).
class http_model_source : public model_source {
public:
    explicit http_model_source(const http_model_source_params & params);

    model_fetch_status fetch(
            const std::string & model_id,
            const std::string & staging_dir,
            voice_files & out,
            std::string & err) override;

private:
    model_fetch_status download(const std::string & remote_path, const std::string & local_path, std::string & err);

    http_model_source_params params_;
};
