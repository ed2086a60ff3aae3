#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// On-disk artifacts of one voice: the network and its JSON config.
struct voice_files {
    std::string model_path;
    std::string config_path;
};

// Engine-owned state of a loaded voice. Shared read-only between requests.
class voice_handle {
public:
    virtual ~voice_handle() = default;
};

class synthesis_engine {
public:
    virtual ~synthesis_engine() = default;

    virtual bool load_voice(
            const voice_files & files,
            std::shared_ptr<const voice_handle> & out,
            int32_t & native_sample_rate,
            std::string & err) = 0;

    // Must be safe to call concurrently, including on the same voice.
    // Produces mono signed 16-bit PCM at the voice's native rate.
    virtual bool synthesize(
            const voice_handle & voice,
            const std::string & text,
            std::vector<int16_t> & pcm,
            std::string & err) const = 0;

    virtual const char * name() const = 0;
};
