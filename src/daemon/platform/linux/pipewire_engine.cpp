#include "platform/linux/pipewire_engine.hpp"

#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireEngine::PipeWireEngine(uint32_t sample_rate)
    : sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireEngine::~PipeWireEngine() {
    deactivate_session();
    pw_deinit();
}

std::expected<void, std::string> PipeWireEngine::activate_session(const AudioSessionOptions& opts) {
    if (loop_) return {};

    loop_ = pw_thread_loop_new("voice-ledger", nullptr);
    if (!loop_) {
        return std::unexpected(std::string("failed to create thread loop"));
    }

    // The Communication role asks the session manager to duck other streams.
    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, opts.duck_others ? "Communication" : "Production",
        PW_KEY_NODE_NAME, "voice-ledger",
        PW_KEY_APP_NAME, "voice-ledger",
        nullptr
    );
    if (!opts.target_device.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, opts.target_device.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "voice-ledger-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(std::string("failed to create stream"));
    }
    return {};
}

void PipeWireEngine::deactivate_session() {
    stop();
    destroy_stream();
}

void PipeWireEngine::install_tap(TapCallback tap) {
    set_tap(std::move(tap));
}

void PipeWireEngine::remove_tap() {
    set_tap(nullptr);
}

void PipeWireEngine::set_tap(TapCallback tap) {
    if (running_) {
        pw_thread_loop_lock(loop_);
        tap_ = std::move(tap);
        pw_thread_loop_unlock(loop_);
    } else {
        tap_ = std::move(tap);
    }
}

std::expected<void, std::string> PipeWireEngine::start() {
    if (running_) return {};
    if (!stream_) return std::unexpected(std::string("audio session not active"));

    // Build format params: S16_LE, mono
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    // No RT_PROCESS: on_process must run on the loop thread so the loop lock
    // excludes it while the tap is swapped.
    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS),
        params, 1
    );
    if (ret < 0) {
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        pw_stream_disconnect(stream_);
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    running_ = true;
    return {};
}

void PipeWireEngine::stop() {
    if (!running_) return;

    pw_thread_loop_lock(loop_);
    pw_stream_disconnect(stream_);
    pw_thread_loop_unlock(loop_);
    pw_thread_loop_stop(loop_);
    running_ = false;
}

void PipeWireEngine::destroy_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireEngine::on_process(void* userdata) {
    auto* self = static_cast<PipeWireEngine*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->tap_) {
        auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
        size_t count = d->chunk->size / sizeof(int16_t);
        self->tap_(std::span<const int16_t>(reinterpret_cast<const int16_t*>(data), count));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireEngine::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
