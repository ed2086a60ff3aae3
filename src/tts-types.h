#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Raw signed 16-bit little-endian mono PCM. Rate is implied by the request.
typedef std::vector<uint8_t> audio_payload;

struct synthesis_request {
    std::string text;
    std::string model_id;          // empty: configured default voice
    int32_t target_sample_rate = 0; // 0: model native rate
};

enum tts_error_kind {
    TTS_ERROR_NONE = 0,
    TTS_ERROR_INVALID_REQUEST,
    TTS_ERROR_MODEL_UNAVAILABLE,
    TTS_ERROR_SYNTHESIS_FAILED,
};

struct tts_error {
    tts_error_kind kind = TTS_ERROR_NONE;
    std::string message;
    bool not_found = false; // model id rejected or absent from the model source
};

enum cache_status {
    CACHE_STATUS_DISABLED = 0,
    CACHE_STATUS_HIT,
    CACHE_STATUS_MISS,
    CACHE_STATUS_ERROR,
};

struct synthesis_result {
    audio_payload audio;
    std::string model_id;
    int32_t sample_rate = 0;
    int32_t native_sample_rate = 0;
    cache_status cache = CACHE_STATUS_DISABLED;
    bool resampled = false;
    bool coalesced = false;
    double synth_ms = 0.0;
    double resample_ms = 0.0;
    double total_ms = 0.0;
};

const char * tts_error_kind_to_cstr(tts_error_kind kind);
const char * cache_status_to_cstr(cache_status status);

void tts_error_set(tts_error & err, tts_error_kind kind, const std::string & message, bool not_found = false);
