#include "piper-engine.h"

#include "tts-log.h"

#include <nlohmann/json.hpp>

#include <espeak-ng/speak_lib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace {

constexpr float k_max_wav_value = 32767.0f;
constexpr int k_espeak_phonemes_ipa = 0x02;

constexpr char32_t k_phoneme_pad = U'_';
constexpr char32_t k_phoneme_bos = U'^';
constexpr char32_t k_phoneme_eos = U'$';

struct piper_voice : public voice_handle {
    bool text_phonemes = false;
    std::string espeak_voice = "en-us";
    std::map<char32_t, std::vector<int64_t>> phoneme_id_map;
    std::map<char32_t, std::vector<char32_t>> phoneme_map;

    int32_t sample_rate = 22050;
    int32_t num_speakers = 1;
    int64_t speaker_id = 0;
    float noise_scale = 0.667f;
    float length_scale = 1.0f;
    float noise_w = 0.8f;

    std::unique_ptr<Ort::Session> session;
};

std::mutex & espeak_mutex() {
    static std::mutex mtx;
    return mtx;
}

bool utf8_decode(const std::string & s, std::vector<char32_t> & out) {
    out.clear();
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = (unsigned char) s[i];
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = (unsigned char) s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return true;
}

bool single_codepoint(const std::string & s, char32_t & out) {
    std::vector<char32_t> cps;
    if (!utf8_decode(s, cps) || cps.size() != 1) {
        return false;
    }
    out = cps[0];
    return true;
}

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

// Split on terminal punctuation followed by whitespace, and on newlines.
// The terminator stays with its sentence.
std::vector<std::string> split_sentences(const std::string & text) {
    std::vector<std::string> out;
    std::string cur;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\n' || c == '\r') {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
            continue;
        }
        cur.push_back(c);
        if (is_sentence_end(c) && (i + 1 == text.size() || std::isspace((unsigned char) text[i + 1]))) {
            out.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) {
        out.push_back(cur);
    }

    std::vector<std::string> trimmed;
    for (const std::string & s : out) {
        const size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos) {
            continue;
        }
        const size_t e = s.find_last_not_of(" \t");
        trimmed.push_back(s.substr(b, e - b + 1));
    }
    return trimmed;
}

void parse_voice_config(const json & root, piper_voice & voice) {
    if (root.contains("audio") && root["audio"].contains("sample_rate")) {
        voice.sample_rate = root["audio"]["sample_rate"].get<int32_t>();
    }
    if (root.contains("espeak") && root["espeak"].contains("voice")) {
        voice.espeak_voice = root["espeak"]["voice"].get<std::string>();
    }
    if (root.contains("phoneme_type")) {
        voice.text_phonemes = root["phoneme_type"].get<std::string>() == "text";
    }
    if (root.contains("num_speakers")) {
        voice.num_speakers = root["num_speakers"].get<int32_t>();
    }
    if (root.contains("inference")) {
        const json & inf = root["inference"];
        voice.noise_scale  = inf.value("noise_scale",  voice.noise_scale);
        voice.length_scale = inf.value("length_scale", voice.length_scale);
        voice.noise_w      = inf.value("noise_w",      voice.noise_w);
    }

    if (!root.contains("phoneme_id_map") || !root["phoneme_id_map"].is_object()) {
        throw std::runtime_error("voice config has no phoneme_id_map");
    }
    for (const auto & item : root["phoneme_id_map"].items()) {
        char32_t from = 0;
        if (!single_codepoint(item.key(), from)) {
            throw std::runtime_error("phoneme_id_map key is not one codepoint: " + item.key());
        }
        for (const auto & id : item.value()) {
            voice.phoneme_id_map[from].push_back(id.get<int64_t>());
        }
    }

    if (root.contains("phoneme_map") && root["phoneme_map"].is_object()) {
        for (const auto & item : root["phoneme_map"].items()) {
            char32_t from = 0;
            if (!single_codepoint(item.key(), from)) {
                throw std::runtime_error("phoneme_map key is not one codepoint: " + item.key());
            }
            for (const auto & to : item.value()) {
                char32_t to_cp = 0;
                if (!single_codepoint(to.get<std::string>(), to_cp)) {
                    throw std::runtime_error("phoneme_map value is not one codepoint");
                }
                voice.phoneme_map[from].push_back(to_cp);
            }
        }
    }

    for (char32_t required : {k_phoneme_pad, k_phoneme_bos, k_phoneme_eos}) {
        if (voice.phoneme_id_map.find(required) == voice.phoneme_id_map.end()) {
            throw std::runtime_error("phoneme_id_map lacks pad/bos/eos symbols");
        }
    }
}

bool phonemize_espeak(const piper_voice & voice, const std::string & sentence, std::vector<char32_t> & out, std::string & err) {
    std::string ipa;
    {
        std::lock_guard<std::mutex> lock(espeak_mutex());
        if (espeak_SetVoiceByName(voice.espeak_voice.c_str()) != EE_OK) {
            err = "espeak-ng voice not available: " + voice.espeak_voice;
            return false;
        }
        const void * ptr = sentence.c_str();
        while (ptr != nullptr) {
            const char * clause = espeak_TextToPhonemes(&ptr, espeakCHARS_AUTO, k_espeak_phonemes_ipa);
            if (clause == nullptr || *clause == '\0') {
                continue;
            }
            if (!ipa.empty()) {
                ipa.push_back(' ');
            }
            ipa += clause;
        }
    }

    if (!utf8_decode(ipa, out)) {
        err = "espeak-ng produced invalid UTF-8";
        return false;
    }
    // espeak drops the terminator; the voices are trained with it present.
    if (!sentence.empty() && is_sentence_end(sentence.back())) {
        out.push_back((char32_t) sentence.back());
    }
    return true;
}

void phonemes_to_ids(const piper_voice & voice, const std::vector<char32_t> & phonemes, std::vector<int64_t> & ids, size_t & n_missing) {
    const std::vector<int64_t> & pad = voice.phoneme_id_map.at(k_phoneme_pad);
    const auto append = [&](char32_t p) {
        auto it = voice.phoneme_id_map.find(p);
        if (it == voice.phoneme_id_map.end()) {
            ++n_missing;
            return;
        }
        ids.insert(ids.end(), it->second.begin(), it->second.end());
        ids.insert(ids.end(), pad.begin(), pad.end());
    };

    ids.clear();
    const std::vector<int64_t> & bos = voice.phoneme_id_map.at(k_phoneme_bos);
    ids.insert(ids.end(), bos.begin(), bos.end());
    ids.insert(ids.end(), pad.begin(), pad.end());

    for (char32_t p : phonemes) {
        auto mapped = voice.phoneme_map.find(p);
        if (mapped != voice.phoneme_map.end()) {
            for (char32_t q : mapped->second) {
                append(q);
            }
        } else {
            append(p);
        }
    }

    const std::vector<int64_t> & eos = voice.phoneme_id_map.at(k_phoneme_eos);
    ids.insert(ids.end(), eos.begin(), eos.end());
}

void infer(const piper_voice & voice, std::vector<int64_t> & ids, std::vector<int16_t> & pcm) {
    auto mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<int64_t> lengths{(int64_t) ids.size()};
    std::vector<float> scales{voice.noise_scale, voice.length_scale, voice.noise_w};
    std::vector<int64_t> sid{voice.speaker_id};

    const std::array<int64_t, 2> ids_shape{1, (int64_t) ids.size()};
    const std::array<int64_t, 1> lengths_shape{1};
    const std::array<int64_t, 1> scales_shape{(int64_t) scales.size()};
    const std::array<int64_t, 1> sid_shape{1};

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), ids_shape.data(), ids_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, lengths.data(), lengths.size(), lengths_shape.data(), lengths_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<float>(mem, scales.data(), scales.size(), scales_shape.data(), scales_shape.size()));
    if (voice.num_speakers > 1) {
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, sid.data(), sid.size(), sid_shape.data(), sid_shape.size()));
    }

    const std::array<const char *, 4> input_names = {"input", "input_lengths", "scales", "sid"};
    const std::array<const char *, 1> output_names = {"output"};

    auto outputs = voice.session->Run(
            Ort::RunOptions{nullptr},
            input_names.data(), inputs.data(), inputs.size(),
            output_names.data(), output_names.size());
    if (outputs.size() != 1 || !outputs.front().IsTensor()) {
        throw std::runtime_error("unexpected model outputs");
    }

    const float * audio = outputs.front().GetTensorData<float>();
    const std::vector<int64_t> shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
    const int64_t n = shape.empty() ? 0 : shape.back();

    float max_abs = 0.01f;
    for (int64_t i = 0; i < n; ++i) {
        max_abs = std::max(max_abs, std::fabs(audio[i]));
    }
    const float scale = k_max_wav_value / max_abs;

    pcm.reserve(pcm.size() + (size_t) n);
    for (int64_t i = 0; i < n; ++i) {
        const float v = std::min(std::max(audio[i] * scale, -32768.0f), 32767.0f);
        pcm.push_back((int16_t) v);
    }
}

} // namespace

piper_engine::piper_engine(const piper_engine_params & params)
    : params_(params),
      env_(ORT_LOGGING_LEVEL_WARNING, "tts-batch") {
}

bool piper_engine::ensure_espeak(std::string & err) {
    std::call_once(espeak_once_, [&]() {
        std::lock_guard<std::mutex> lock(espeak_mutex());
        const char * path = params_.espeak_data_path.empty() ? nullptr : params_.espeak_data_path.c_str();
        const int rate = espeak_Initialize(AUDIO_OUTPUT_SYNCHRONOUS, 0, path, 0);
        if (rate < 0) {
            espeak_err_ = "espeak_Initialize failed (data path: " +
                    (params_.espeak_data_path.empty() ? std::string("default") : params_.espeak_data_path) + ")";
            return;
        }
        espeak_ok_ = true;
        TTS_LOG_INFO("piper: espeak-ng initialized\n");
    });
    if (!espeak_ok_) {
        err = espeak_err_;
        return false;
    }
    return true;
}

bool piper_engine::load_voice(
        const voice_files & files,
        std::shared_ptr<const voice_handle> & out,
        int32_t & native_sample_rate,
        std::string & err) {
    const auto t0 = std::chrono::steady_clock::now();
    auto voice = std::make_shared<piper_voice>();

    try {
        std::ifstream in(files.config_path);
        if (!in) {
            err = "failed to open voice config: " + files.config_path;
            return false;
        }
        parse_voice_config(json::parse(in), *voice);
    } catch (const std::exception & e) {
        err = "invalid voice config " + files.config_path + ": " + e.what();
        return false;
    }

    if (voice->sample_rate <= 0) {
        err = "voice config has non-positive sample_rate";
        return false;
    }
    if (!voice->text_phonemes && !ensure_espeak(err)) {
        return false;
    }

    try {
        Ort::SessionOptions opts;
        if (params_.n_threads > 0) {
            opts.SetIntraOpNumThreads(params_.n_threads);
        }
        opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_DISABLE_ALL);
        opts.DisableCpuMemArena();
        opts.DisableMemPattern();
        opts.DisableProfiling();
        voice->session.reset(new Ort::Session(env_, files.model_path.c_str(), opts));
    } catch (const Ort::Exception & e) {
        err = "failed to load " + files.model_path + ": " + e.what();
        return false;
    }

    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    TTS_LOG_INFO("piper: loaded %s (rate=%d speakers=%d phonemes=%s) in %.2f ms\n",
            files.model_path.c_str(), voice->sample_rate, voice->num_speakers,
            voice->text_phonemes ? "text" : "espeak", ms);

    native_sample_rate = voice->sample_rate;
    out = voice;
    return true;
}

bool piper_engine::synthesize(
        const voice_handle & handle,
        const std::string & text,
        std::vector<int16_t> & pcm,
        std::string & err) const {
    const piper_voice * voice = dynamic_cast<const piper_voice *>(&handle);
    if (voice == nullptr || !voice->session) {
        err = "voice handle does not belong to the piper engine";
        return false;
    }

    pcm.clear();
    const size_t n_silence = (size_t) std::lround(params_.sentence_silence_sec * (float) voice->sample_rate);
    size_t n_missing = 0;

    const std::vector<std::string> sentences = split_sentences(text);
    for (size_t si = 0; si < sentences.size(); ++si) {
        std::vector<char32_t> phonemes;
        if (voice->text_phonemes) {
            if (!utf8_decode(sentences[si], phonemes)) {
                err = "text is not valid UTF-8";
                return false;
            }
        } else if (!phonemize_espeak(*voice, sentences[si], phonemes, err)) {
            return false;
        }

        std::vector<int64_t> ids;
        phonemes_to_ids(*voice, phonemes, ids, n_missing);

        try {
            infer(*voice, ids, pcm);
        } catch (const std::exception & e) {
            err = std::string("inference failed: ") + e.what();
            return false;
        }
        if (si + 1 < sentences.size()) {
            pcm.insert(pcm.end(), n_silence, (int16_t) 0);
        }
    }

    if (n_missing > 0) {
        TTS_LOG_DEBUG("piper: %zu phoneme(s) without ids were skipped\n", n_missing);
    }
    if (pcm.empty()) {
        err = "synthesis produced no audio";
        return false;
    }
    return true;
}
