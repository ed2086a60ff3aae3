#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Band-limited linear resampling of mono 16-bit PCM.
// Output length is round(n_in * target_rate / source_rate); equal rates copy
// the input unchanged.
bool resample_pcm16(
        const std::vector<int16_t> & in,
        int32_t source_rate,
        int32_t target_rate,
        std::vector<int16_t> & out,
        std::string & err);

uint64_t resample_expected_frames(uint64_t n_in, int32_t source_rate, int32_t target_rate);
