#pragma once

#include "synthesis-engine.h"

#include <mutex>
#include <string>

#include <onnxruntime_cxx_api.h>

struct piper_engine_params {
    std::string espeak_data_path;       // empty: espeak-ng built-in default
    int32_t n_threads = 0;              // intra-op threads per session, 0 = runtime default
    float sentence_silence_sec = 0.2f;
};

// Piper/VITS voices: espeak-ng (or raw codepoint) phonemization followed by a
// single ONNX Runtime session per voice.
class piper_engine : public synthesis_engine {
public:
    explicit piper_engine(const piper_engine_params & params);

    bool load_voice(
            const voice_files & files,
            std::shared_ptr<const voice_handle> & out,
            int32_t & native_sample_rate,
            std::string & err) override;

    bool synthesize(
            const voice_handle & voice,
            const std::string & text,
            std::vector<int16_t> & pcm,
            std::string & err) const override;

    const char * name() const override { return "piper"; }

private:
    bool ensure_espeak(std::string & err);

    piper_engine_params params_;
    Ort::Env env_;

    std::once_flag espeak_once_;
    bool espeak_ok_ = false;
    std::string espeak_err_;
};
