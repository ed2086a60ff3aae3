#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

static constexpr size_t k_wav_header_bytes = 44;

// Serialize samples as little-endian bytes regardless of host byte order.
std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t> & samples);

// Fails when the byte count is odd.
bool pcm16_from_bytes(const std::vector<uint8_t> & bytes, std::vector<int16_t> & samples, std::string & err);

// 44-byte RIFF header for 16-bit mono PCM.
void build_wav_header(uint8_t * p, uint32_t sample_rate, uint32_t pcm_bytes);

bool save_pcm16_file(
        const std::string & path,
        const std::vector<uint8_t> & pcm,
        int32_t sample_rate,
        bool with_wav_header,
        std::string & err);
