#include "tts-log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace {

static void tts_log_callback_default(tts_log_level level, const char * text, void * /* user_data */) {
    const char * prefix = "";
    switch (level) {
        case TTS_LOG_LEVEL_DEBUG: prefix = "debug: ";   break;
        case TTS_LOG_LEVEL_INFO:  prefix = "info: ";    break;
        case TTS_LOG_LEVEL_WARN:  prefix = "warning: "; break;
        case TTS_LOG_LEVEL_ERROR: prefix = "error: ";   break;
    }
    std::fprintf(stderr, "%s%s", prefix, text);
}

struct tts_log_state {
    std::mutex mtx;
    tts_log_callback callback = tts_log_callback_default;
    void * user_data = nullptr;
    std::atomic<int> min_level {TTS_LOG_LEVEL_INFO};
};

static tts_log_state & log_state() {
    static tts_log_state st;
    return st;
}

} // namespace

void tts_log_set(tts_log_callback callback, void * user_data) {
    auto & st = log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    st.callback = callback != nullptr ? callback : tts_log_callback_default;
    st.user_data = callback != nullptr ? user_data : nullptr;
}

void tts_log_set_level(tts_log_level min_level) {
    log_state().min_level.store((int) min_level);
}

tts_log_level tts_log_get_level() {
    return (tts_log_level) log_state().min_level.load();
}

bool tts_log_parse_level(const std::string & s, tts_log_level & out) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });

    if (v == "debug") {
        out = TTS_LOG_LEVEL_DEBUG;
        return true;
    }
    if (v == "info") {
        out = TTS_LOG_LEVEL_INFO;
        return true;
    }
    if (v == "warn" || v == "warning") {
        out = TTS_LOG_LEVEL_WARN;
        return true;
    }
    if (v == "error") {
        out = TTS_LOG_LEVEL_ERROR;
        return true;
    }
    return false;
}

const char * tts_log_level_to_cstr(tts_log_level level) {
    switch (level) {
        case TTS_LOG_LEVEL_DEBUG: return "debug";
        case TTS_LOG_LEVEL_INFO:  return "info";
        case TTS_LOG_LEVEL_WARN:  return "warn";
        case TTS_LOG_LEVEL_ERROR: return "error";
    }
    return "info";
}

void tts_log_internal(tts_log_level level, const char * fmt, ...) {
    auto & st = log_state();
    if ((int) level < st.min_level.load()) {
        return;
    }

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    const int len = std::vsnprintf(buf, sizeof(buf), fmt, args);

    std::lock_guard<std::mutex> lock(st.mtx);
    if (len >= 0 && (size_t) len < sizeof(buf)) {
        st.callback(level, buf, st.user_data);
    } else if (len >= 0) {
        std::vector<char> big((size_t) len + 1);
        std::vsnprintf(big.data(), big.size(), fmt, args_copy);
        st.callback(level, big.data(), st.user_data);
    }
    va_end(args_copy);
    va_end(args);
}
