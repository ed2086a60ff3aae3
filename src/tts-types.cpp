#include "tts-types.h"

const char * tts_error_kind_to_cstr(tts_error_kind kind) {
    switch (kind) {
        case TTS_ERROR_NONE:              return "none";
        case TTS_ERROR_INVALID_REQUEST:   return "invalid_request";
        case TTS_ERROR_MODEL_UNAVAILABLE: return "model_unavailable";
        case TTS_ERROR_SYNTHESIS_FAILED:  return "synthesis_failed";
    }
    return "unknown";
}

const char * cache_status_to_cstr(cache_status status) {
    switch (status) {
        case CACHE_STATUS_DISABLED: return "DISABLED";
        case CACHE_STATUS_HIT:      return "HIT";
        case CACHE_STATUS_MISS:     return "MISS";
        case CACHE_STATUS_ERROR:    return "ERROR";
    }
    return "DISABLED";
}

void tts_error_set(tts_error & err, tts_error_kind kind, const std::string & message, bool not_found) {
    err.kind = kind;
    err.message = message;
    err.not_found = not_found;
}
