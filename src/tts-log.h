#pragma once

#include <string>

enum tts_log_level {
    TTS_LOG_LEVEL_DEBUG = 0,
    TTS_LOG_LEVEL_INFO  = 1,
    TTS_LOG_LEVEL_WARN  = 2,
    TTS_LOG_LEVEL_ERROR = 3,
};

typedef void (*tts_log_callback)(tts_log_level level, const char * text, void * user_data);

// Replace the sink. Passing nullptr restores the default stderr sink.
void tts_log_set(tts_log_callback callback, void * user_data);
void tts_log_set_level(tts_log_level min_level);
tts_log_level tts_log_get_level();

bool tts_log_parse_level(const std::string & s, tts_log_level & out);
const char * tts_log_level_to_cstr(tts_log_level level);

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void tts_log_internal(tts_log_level level, const char * fmt, ...);

#define TTS_LOG_DEBUG(...) tts_log_internal(TTS_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define TTS_LOG_INFO(...)  tts_log_internal(TTS_LOG_LEVEL_INFO,  __VA_ARGS__)
#define TTS_LOG_WARN(...)  tts_log_internal(TTS_LOG_LEVEL_WARN,  __VA_ARGS__)
#define TTS_LOG_ERROR(...) tts_log_internal(TTS_LOG_LEVEL_ERROR, __VA_ARGS__)
