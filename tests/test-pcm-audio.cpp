#include "pcm-audio.h"
#include "test-stubs.h"

#include <gtest/gtest.h>

#include <cstring>
#include <fstream>
#include <iterator>

static uint32_t read_u32_le(const uint8_t * p) {
    return (uint32_t) p[0] | ((uint32_t) p[1] << 8) | ((uint32_t) p[2] << 16) | ((uint32_t) p[3] << 24);
}

static uint16_t read_u16_le(const uint8_t * p) {
    return (uint16_t) (p[0] | (p[1] << 8));
}

TEST(PcmAudio, SamplesAreLittleEndian) {
    const std::vector<int16_t> samples = {0, 1, -1, 0x1234, -32768, 32767};
    const std::vector<uint8_t> bytes = pcm16_to_bytes(samples);
    const std::vector<uint8_t> want = {
        0x00, 0x00,
        0x01, 0x00,
        0xFF, 0xFF,
        0x34, 0x12,
        0x00, 0x80,
        0xFF, 0x7F,
    };
    EXPECT_EQ(bytes, want);

    std::vector<int16_t> back;
    std::string err;
    ASSERT_TRUE(pcm16_from_bytes(bytes, back, err)) << err;
    EXPECT_EQ(back, samples);
}

TEST(PcmAudio, OddByteCountIsRejected) {
    std::vector<int16_t> samples;
    std::string err;
    EXPECT_FALSE(pcm16_from_bytes({0x01, 0x02, 0x03}, samples, err));
    EXPECT_FALSE(err.empty());
}

TEST(PcmAudio, WavHeaderLayout) {
    uint8_t h[k_wav_header_bytes];
    build_wav_header(h, 16000, 3200);

    EXPECT_EQ(std::memcmp(h, "RIFF", 4), 0);
    EXPECT_EQ(read_u32_le(h + 4), 36u + 3200u);
    EXPECT_EQ(std::memcmp(h + 8, "WAVE", 4), 0);
    EXPECT_EQ(std::memcmp(h + 12, "fmt ", 4), 0);
    EXPECT_EQ(read_u32_le(h + 16), 16u);
    EXPECT_EQ(read_u16_le(h + 20), 1);
    EXPECT_EQ(read_u16_le(h + 22), 1);
    EXPECT_EQ(read_u32_le(h + 24), 16000u);
    EXPECT_EQ(read_u32_le(h + 28), 32000u);
    EXPECT_EQ(read_u16_le(h + 32), 2);
    EXPECT_EQ(read_u16_le(h + 34), 16);
    EXPECT_EQ(std::memcmp(h + 36, "data", 4), 0);
    EXPECT_EQ(read_u32_le(h + 40), 3200u);
}

static std::vector<uint8_t> read_file(const std::filesystem::path & p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

TEST(PcmAudio, SaveWritesRawOrWav) {
    temp_dir dir;
    const std::vector<uint8_t> pcm = pcm16_to_bytes({100, -100, 200, -200});
    std::string err;

    const auto raw_path = dir.path / "out.pcm";
    ASSERT_TRUE(save_pcm16_file(raw_path.string(), pcm, 22050, false, err)) << err;
    EXPECT_EQ(read_file(raw_path), pcm);

    const auto wav_path = dir.path / "nested" / "out.wav";
    ASSERT_TRUE(save_pcm16_file(wav_path.string(), pcm, 22050, true, err)) << err;
    const std::vector<uint8_t> wav = read_file(wav_path);
    ASSERT_EQ(wav.size(), k_wav_header_bytes + pcm.size());
    EXPECT_EQ(read_u32_le(wav.data() + 24), 22050u);
    EXPECT_EQ(read_u32_le(wav.data() + 40), (uint32_t) pcm.size());
    EXPECT_TRUE(std::equal(pcm.begin(), pcm.end(), wav.begin() + k_wav_header_bytes));
}
