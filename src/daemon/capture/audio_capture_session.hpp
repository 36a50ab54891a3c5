#pragma once

#include "capture/recording_state.hpp"
#include "platform/audio_engine.hpp"
#include "platform/executor.hpp"
#include "platform/permissions.hpp"
#include "recognition/recognizer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class CaptureError {
    PermissionDenied,
    RecognizerUnavailable,
    AudioSessionFailed,
    RequestCreationFailed,
    EngineStartFailed,
};

// User-facing description.
const char* to_string(CaptureError e);

struct ResourceStatus {
    bool engine_running = false;
    bool tap_installed = false;
    bool has_active_task = false;
    bool has_active_request = false;
    bool session_active = false;

    // A running engine without a task feeds audio nowhere.
    bool healthy() const { return !(engine_running && !has_active_task); }
    std::string describe() const;
};

struct HealthStatus {
    enum class Level { Healthy, Degraded, Critical };

    Level level = Level::Healthy;
    std::string message;

    bool operational() const { return level != Level::Critical; }
};

const char* to_string(HealthStatus::Level level);

// One recording + streaming transcription session at a time.
//
// The four resources (running engine, installed tap, recognition task,
// recognition request) plus the audio session are tracked by explicit flags
// that are only touched on the owner executor. Audio and recognizer callbacks
// arrive on foreign threads and are posted to the owner, tagged with the
// generation of the session that produced them; anything tagged with an older
// generation, or arriving after teardown, is dropped.
class AudioCaptureSession {
public:
    struct Options {
        std::chrono::milliseconds stop_grace{300};
        float level_smoothing = 0.3f;
        AudioSessionOptions audio;
        bool verbose = false;
    };

    struct Callbacks {
        std::function<void(const Transcript&)> on_transcript;
        std::function<void(float)> on_audio_level;
        std::function<void(const RecordingState&)> on_state_changed;
    };

    AudioCaptureSession(AudioEngine& engine, SpeechRecognizer& recognizer,
                        PermissionProvider& permissions, Executor& owner, Options opts);
    ~AudioCaptureSession();

    AudioCaptureSession(const AudioCaptureSession&) = delete;
    AudioCaptureSession& operator=(const AudioCaptureSession&) = delete;

    void set_callbacks(Callbacks callbacks) { callbacks_ = std::move(callbacks); }

    std::expected<void, CaptureError> start();
    // Ends audio input, then tears down after the grace delay (or as soon as the
    // final transcript lands). No-op unless recording.
    void stop();

    // Last known recognizer availability, reported by a check that ran off the
    // owner thread. A loss stops the recording only when the check began during
    // it: `generation` is the value of generation() when the check started,
    // nullopt for the current session.
    void on_availability_changed(bool available, std::optional<uint64_t> generation = std::nullopt);

    uint64_t generation() const { return generation_; }
    bool recognizer_available() const { return recognizer_available_; }

    const RecordingState& state() const { return state_; }
    const std::string& transcript() const { return transcript_; }
    float audio_level() const { return audio_level_; }
    const std::optional<VoiceRecording>& last_recording() const { return last_recording_; }

    ResourceStatus resource_status() const;
    HealthStatus health_check() const;

private:
    // Written on the audio thread, consumed on the owner. Only the latest level
    // matters, so at most one hand-off is queued at a time.
    struct LevelMailbox {
        std::atomic<float> latest{0.0f};
        std::atomic<bool> posted{false};
    };

    void teardown();
    void complete_stop();
    void on_stop_timer(uint64_t generation);
    void on_recognition_event(uint64_t generation, SpeechRecognizer::Event event);
    void on_level(uint64_t generation, const std::shared_ptr<LevelMailbox>& mailbox);
    void publish_level(float level);
    void set_state(RecordingState state);
    bool has_resources() const;
    void log(const std::string& msg);

    AudioEngine& engine_;
    SpeechRecognizer& recognizer_;
    PermissionProvider& permissions_;
    Executor& owner_;
    Options opts_;
    Callbacks callbacks_;

    RecordingState state_;
    std::string transcript_;
    float audio_level_ = 0.0f;
    std::optional<VoiceRecording> last_recording_;
    std::chrono::steady_clock::time_point record_start_;
    std::chrono::system_clock::time_point started_at_;

    bool session_active_ = false;
    bool engine_running_ = false;
    bool tap_installed_ = false;
    std::shared_ptr<RecognitionRequest> request_;
    std::unique_ptr<RecognitionTask> task_;

    uint64_t generation_ = 0;
    std::optional<Executor::TimerId> stop_timer_;
    bool recognizer_available_ = true;
};
