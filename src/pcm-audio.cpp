#include "pcm-audio.h"

#include <cstring>
#include <filesystem>
#include <fstream>

static void put_u16_le(uint8_t * p, uint16_t v) {
    p[0] = (uint8_t) (v & 0xFF);
    p[1] = (uint8_t) ((v >> 8) & 0xFF);
}

static void put_u32_le(uint8_t * p, uint32_t v) {
    p[0] = (uint8_t) (v & 0xFF);
    p[1] = (uint8_t) ((v >> 8) & 0xFF);
    p[2] = (uint8_t) ((v >> 16) & 0xFF);
    p[3] = (uint8_t) ((v >> 24) & 0xFF);
}

std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t> & samples) {
    std::vector<uint8_t> out(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        put_u16_le(out.data() + i * 2, (uint16_t) samples[i]);
    }
    return out;
}

bool pcm16_from_bytes(const std::vector<uint8_t> & bytes, std::vector<int16_t> & samples, std::string & err) {
    if (bytes.size() % 2 != 0) {
        err = "PCM byte count is odd: " + std::to_string(bytes.size());
        return false;
    }
    samples.resize(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const uint16_t v = (uint16_t) (bytes[i * 2] | ((uint16_t) bytes[i * 2 + 1] << 8));
        samples[i] = (int16_t) v;
    }
    return true;
}

void build_wav_header(uint8_t * p, uint32_t sample_rate, uint32_t pcm_bytes) {
    const uint32_t chunk_size = 36 + pcm_bytes;
    const uint32_t byte_rate = sample_rate * 2;
    std::memcpy(p, "RIFF", 4);
    put_u32_le(p + 4, chunk_size);
    std::memcpy(p + 8, "WAVE", 4);
    std::memcpy(p + 12, "fmt ", 4);
    put_u32_le(p + 16, 16);          // fmt chunk size
    put_u16_le(p + 20, 1);           // PCM
    put_u16_le(p + 22, 1);           // mono
    put_u32_le(p + 24, sample_rate);
    put_u32_le(p + 28, byte_rate);
    put_u16_le(p + 32, 2);           // block align
    put_u16_le(p + 34, 16);          // bits per sample
    std::memcpy(p + 36, "data", 4);
    put_u32_le(p + 40, pcm_bytes);
}

bool save_pcm16_file(
        const std::string & path,
        const std::vector<uint8_t> & pcm,
        int32_t sample_rate,
        bool with_wav_header,
        std::string & err) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    if (with_wav_header) {
        uint8_t header[k_wav_header_bytes];
        build_wav_header(header, (uint32_t) sample_rate, (uint32_t) pcm.size());
        file.write(reinterpret_cast<const char *>(header), (std::streamsize) sizeof(header));
    }
    file.write(reinterpret_cast<const char *>(pcm.data()), (std::streamsize) pcm.size());
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}
