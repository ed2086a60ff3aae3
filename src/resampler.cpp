#include "resampler.h"

#include <algorithm>
#include <cstring>

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_DECODING
#define MA_NO_ENCODING
#define MA_NO_DEVICE_IO
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_NODE_GRAPH
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MA_API static
#include <miniaudio.h>

static constexpr ma_uint32 k_resampler_lpf_order = 8;

uint64_t resample_expected_frames(uint64_t n_in, int32_t source_rate, int32_t target_rate) {
    if (source_rate <= 0 || target_rate <= 0) {
        return 0;
    }
    // round-half-up of n_in * target / source in integer arithmetic
    const uint64_t num = n_in * (uint64_t) target_rate;
    return (num + (uint64_t) source_rate / 2) / (uint64_t) source_rate;
}

bool resample_pcm16(
        const std::vector<int16_t> & in,
        int32_t source_rate,
        int32_t target_rate,
        std::vector<int16_t> & out,
        std::string & err) {
    if (source_rate <= 0 || target_rate <= 0) {
        err = "invalid sample rates: " + std::to_string(source_rate) + " -> " + std::to_string(target_rate);
        return false;
    }
    if (source_rate == target_rate) {
        out = in;
        return true;
    }

    out.clear();
    const uint64_t n_expected = resample_expected_frames(in.size(), source_rate, target_rate);
    if (in.empty() || n_expected == 0) {
        return true;
    }

    ma_resampler_config rcfg = ma_resampler_config_init(
            ma_format_s16,
            1,
            (ma_uint32) source_rate,
            (ma_uint32) target_rate,
            ma_resample_algorithm_linear);
    rcfg.linear.lpfOrder = k_resampler_lpf_order;

    ma_resampler resampler;
    ma_result result = ma_resampler_init(&rcfg, nullptr, &resampler);
    if (result != MA_SUCCESS) {
        err = "ma_resampler_init failed: " + std::to_string((int) result);
        return false;
    }

    // Trailing silence flushes the low-pass filter; the leading output
    // latency is dropped so the result stays time-aligned with the input.
    const ma_uint64 in_latency = ma_resampler_get_input_latency(&resampler);
    const ma_uint64 out_latency = ma_resampler_get_output_latency(&resampler);

    std::vector<int16_t> padded(in.size() + (size_t) in_latency + 1, 0);
    std::memcpy(padded.data(), in.data(), in.size() * sizeof(int16_t));

    ma_uint64 n_out_cap = 0;
    if (ma_resampler_get_expected_output_frame_count(&resampler, padded.size(), &n_out_cap) != MA_SUCCESS) {
        n_out_cap = resample_expected_frames(padded.size(), source_rate, target_rate);
    }
    n_out_cap += out_latency + 2;

    std::vector<int16_t> raw((size_t) n_out_cap, 0);
    ma_uint64 n_in_used = padded.size();
    ma_uint64 n_out_made = n_out_cap;
    result = ma_resampler_process_pcm_frames(&resampler, padded.data(), &n_in_used, raw.data(), &n_out_made);
    ma_resampler_uninit(&resampler, nullptr);
    if (result != MA_SUCCESS) {
        err = "ma_resampler_process_pcm_frames failed: " + std::to_string((int) result);
        return false;
    }

    const size_t skip = (size_t) std::min<ma_uint64>(out_latency, n_out_made);
    const size_t avail = (size_t) n_out_made - skip;
    const size_t n_take = std::min<size_t>(avail, (size_t) n_expected);

    out.assign(raw.begin() + (std::ptrdiff_t) skip, raw.begin() + (std::ptrdiff_t) (skip + n_take));
    // The filter can come up a frame or two short; hold the last value.
    const int16_t tail = out.empty() ? 0 : out.back();
    out.resize((size_t) n_expected, tail);
    return true;
}
