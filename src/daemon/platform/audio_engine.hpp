#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>

struct AudioSessionOptions {
    bool duck_others = true;
    std::string target_device; // empty: system default source
};

// Microphone pipeline split into the resources a capture session tracks:
// the audio session, the single buffer tap and the running engine.
class AudioEngine {
public:
    // Called on the audio thread with mono S16 samples. Must not block.
    using TapCallback = std::function<void(std::span<const int16_t>)>;

    virtual ~AudioEngine() = default;

    virtual std::expected<void, std::string> activate_session(const AudioSessionOptions& opts) = 0;
    virtual void deactivate_session() = 0;

    // Replaces any previous tap. After remove_tap() returns no callback is running.
    virtual void install_tap(TapCallback tap) = 0;
    virtual void remove_tap() = 0;

    virtual std::expected<void, std::string> start() = 0;
    virtual void stop() = 0;

    virtual uint32_t sample_rate() const = 0;
};
