#pragma once

#include "platform/audio_engine.hpp"

#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Capture stream on a PipeWire thread loop. activate_session() creates the
// loop and stream, start() connects the stream and runs the loop, and
// deactivate_session() destroys both. The process callback runs on the loop
// thread, so taps are swapped under the loop lock.
class PipeWireEngine : public AudioEngine {
public:
    explicit PipeWireEngine(uint32_t sample_rate = 16000);
    ~PipeWireEngine() override;

    PipeWireEngine(const PipeWireEngine&) = delete;
    PipeWireEngine& operator=(const PipeWireEngine&) = delete;

    std::expected<void, std::string> activate_session(const AudioSessionOptions& opts) override;
    void deactivate_session() override;

    void install_tap(TapCallback tap) override;
    void remove_tap() override;

    std::expected<void, std::string> start() override;
    void stop() override;

    uint32_t sample_rate() const override { return sample_rate_; }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void set_tap(TapCallback tap);
    void destroy_stream();

    uint32_t sample_rate_;
    bool running_ = false;
    TapCallback tap_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
