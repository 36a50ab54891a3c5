#include "capture/audio_capture_session.hpp"

#include "capture/audio_level.hpp"
#include "recognition/error_classifier.hpp"

#include <format>
#include <print>
#include <type_traits>

const char* to_string(CaptureError e) {
    switch (e) {
        case CaptureError::PermissionDenied:
            return "microphone and speech recognition permissions are required";
        case CaptureError::RecognizerUnavailable:
            return "speech recognition service is unavailable";
        case CaptureError::AudioSessionFailed:
            return "audio session configuration failed";
        case CaptureError::RequestCreationFailed:
            return "could not create a speech recognition request";
        case CaptureError::EngineStartFailed:
            return "audio engine failed to start";
    }
    return "capture failed";
}

const char* to_string(HealthStatus::Level level) {
    switch (level) {
        case HealthStatus::Level::Healthy: return "healthy";
        case HealthStatus::Level::Degraded: return "degraded";
        case HealthStatus::Level::Critical: return "critical";
    }
    return "unknown";
}

std::string ResourceStatus::describe() const {
    std::string out;
    auto add = [&out](bool on, const char* what) {
        if (!on) return;
        if (!out.empty()) out += ", ";
        out += what;
    };
    add(engine_running, "engine running");
    add(tap_installed, "tap installed");
    add(has_active_task, "recognition task");
    add(has_active_request, "recognition request");
    add(session_active, "audio session");
    return out.empty() ? "idle" : out;
}

namespace {

std::string user_message(const RecognitionError& err) {
    if (err.domain == recognition_error::kBackendDomain &&
        err.code == recognition_error::kBackendUnreachable) {
        return "cannot reach the speech recognition server, check the network";
    }
    return "speech recognition failed: " + err.message;
}

} // namespace

AudioCaptureSession::AudioCaptureSession(AudioEngine& engine, SpeechRecognizer& recognizer,
                                         PermissionProvider& permissions, Executor& owner,
                                         Options opts)
    : engine_(engine), recognizer_(recognizer), permissions_(permissions),
      owner_(owner), opts_(std::move(opts)) {}

AudioCaptureSession::~AudioCaptureSession() {
    if (stop_timer_) owner_.cancel(*stop_timer_);
    teardown();
}

std::expected<void, CaptureError> AudioCaptureSession::start() {
    if (state_.kind == RecordingState::Kind::Recording ||
        state_.kind == RecordingState::Kind::Processing || has_resources()) {
        log("previous session still holds resources, forcing cleanup");
        if (stop_timer_) {
            owner_.cancel(*stop_timer_);
            stop_timer_.reset();
        }
        teardown();
        set_state(RecordingState::idle());
    }

    if (!permissions_.microphone_granted() || !permissions_.speech_granted()) {
        return std::unexpected(CaptureError::PermissionDenied);
    }
    if (!recognizer_available_) {
        return std::unexpected(CaptureError::RecognizerUnavailable);
    }

    const uint64_t gen = ++generation_;
    transcript_.clear();
    last_recording_.reset();
    publish_level(0.0f);

    if (auto r = engine_.activate_session(opts_.audio); !r) {
        std::println(stderr, "capture: audio session activation failed: {}", r.error());
        teardown();
        return std::unexpected(CaptureError::AudioSessionFailed);
    }
    session_active_ = true;

    request_ = recognizer_.make_request(/*partial_results=*/true);
    if (!request_) {
        teardown();
        return std::unexpected(CaptureError::RequestCreationFailed);
    }

    task_ = recognizer_.start_task(request_, [this, gen](SpeechRecognizer::Event event) {
        owner_.post([this, gen, event = std::move(event)]() mutable {
            on_recognition_event(gen, std::move(event));
        });
    });
    if (!task_) {
        teardown();
        return std::unexpected(CaptureError::RequestCreationFailed);
    }

    auto mailbox = std::make_shared<LevelMailbox>();
    engine_.install_tap([this, gen, request = request_, mailbox](std::span<const int16_t> samples) {
        request->append(samples);

        mailbox->latest.store(audio_level::normalize(audio_level::rms(samples)),
                              std::memory_order_relaxed);
        if (!mailbox->posted.exchange(true, std::memory_order_acq_rel)) {
            owner_.post([this, gen, mailbox] { on_level(gen, mailbox); });
        }
    });
    tap_installed_ = true;

    if (auto r = engine_.start(); !r) {
        std::println(stderr, "capture: audio engine start failed: {}", r.error());
        teardown();
        return std::unexpected(CaptureError::EngineStartFailed);
    }
    engine_running_ = true;

    record_start_ = std::chrono::steady_clock::now();
    started_at_ = std::chrono::system_clock::now();
    set_state(RecordingState::recording());
    log("recording started");
    return {};
}

void AudioCaptureSession::stop() {
    if (!state_.is_recording()) return;

    set_state(RecordingState::processing());

    // Let the recognizer finish the audio it already has.
    if (request_) request_->end_audio();

    const uint64_t gen = generation_;
    stop_timer_ = owner_.post_after(opts_.stop_grace, [this, gen] { on_stop_timer(gen); });
}

void AudioCaptureSession::on_availability_changed(bool available,
                                                  std::optional<uint64_t> generation) {
    if (available != recognizer_available_) {
        log(std::format("recognizer availability changed: {}", available));
    }
    recognizer_available_ = available;

    if (generation && *generation != generation_) return;
    if (!available && state_.is_recording()) {
        stop();
    }
}

void AudioCaptureSession::on_stop_timer(uint64_t generation) {
    stop_timer_.reset();
    if (generation != generation_ || state_.kind != RecordingState::Kind::Processing) return;
    complete_stop();
}

void AudioCaptureSession::complete_stop() {
    if (stop_timer_) {
        owner_.cancel(*stop_timer_);
        stop_timer_.reset();
    }

    teardown();

    auto elapsed = std::chrono::steady_clock::now() - record_start_;
    last_recording_ = VoiceRecording{
        .text = transcript_,
        .duration_s = std::chrono::duration<double>(elapsed).count(),
        .started_at = started_at_,
    };
    log(std::format("recording finished, {:.1f}s, {} bytes of transcript",
                    last_recording_->duration_s, transcript_.size()));

    set_state(RecordingState::completed());
}

void AudioCaptureSession::on_recognition_event(uint64_t generation, SpeechRecognizer::Event event) {
    // Superseded session, or teardown already ran.
    if (generation != generation_ || !task_) {
        log("dropping recognition event from a finished session");
        return;
    }

    if (auto* t = std::get_if<Transcript>(&event)) {
        transcript_ = t->text;
        if (callbacks_.on_transcript) callbacks_.on_transcript(*t);
        if (t->is_final && state_.kind == RecordingState::Kind::Processing) {
            complete_stop();
        }
        return;
    }

    auto& err = std::get<RecognitionError>(event);
    if (classify(err.domain, err.code) == ErrorDisposition::Ignore) {
        log(std::format("ignoring recognizer error {}:{} ({})", err.domain, err.code, err.message));
        // A terminal event after end_audio means nothing more will arrive.
        if (state_.kind == RecordingState::Kind::Processing) {
            complete_stop();
        }
        return;
    }

    std::println(stderr, "capture: recognition error {}:{}: {}", err.domain, err.code, err.message);
    if (stop_timer_) {
        owner_.cancel(*stop_timer_);
        stop_timer_.reset();
    }
    teardown();
    set_state(RecordingState::error(user_message(err)));
}

void AudioCaptureSession::on_level(uint64_t generation,
                                   const std::shared_ptr<LevelMailbox>& mailbox) {
    mailbox->posted.store(false, std::memory_order_release);
    if (generation != generation_ || !engine_running_) return;

    float latest = mailbox->latest.load(std::memory_order_relaxed);
    publish_level(audio_level::smooth(audio_level_, latest, opts_.level_smoothing));
}

void AudioCaptureSession::publish_level(float level) {
    audio_level_ = level;
    if (callbacks_.on_audio_level) callbacks_.on_audio_level(level);
}

void AudioCaptureSession::teardown() {
    if (engine_running_) {
        engine_.stop();
        engine_running_ = false;
    }
    if (tap_installed_) {
        engine_.remove_tap();
        tap_installed_ = false;
    }
    if (task_) {
        task_->cancel();
        task_.reset();
    }
    if (request_) {
        request_->end_audio();
        request_.reset();
    }
    if (session_active_) {
        engine_.deactivate_session();
        session_active_ = false;
    }
    if (audio_level_ != 0.0f) publish_level(0.0f);
}

bool AudioCaptureSession::has_resources() const {
    return session_active_ || engine_running_ || tap_installed_ || task_ || request_;
}

void AudioCaptureSession::set_state(RecordingState state) {
    if (state == state_) return;
    state_ = std::move(state);
    if (callbacks_.on_state_changed) callbacks_.on_state_changed(state_);
}

ResourceStatus AudioCaptureSession::resource_status() const {
    return ResourceStatus{
        .engine_running = engine_running_,
        .tap_installed = tap_installed_,
        .has_active_task = task_ != nullptr,
        .has_active_request = request_ != nullptr,
        .session_active = session_active_,
    };
}

HealthStatus AudioCaptureSession::health_check() const {
    if (!permissions_.microphone_granted()) {
        return {HealthStatus::Level::Critical, "microphone permission not granted"};
    }
    if (!permissions_.speech_granted()) {
        return {HealthStatus::Level::Critical, "speech recognition permission not granted"};
    }
    if (!recognizer_available_) {
        return {HealthStatus::Level::Degraded, "speech recognizer unavailable"};
    }
    if (state_.is_recording() && !engine_running_) {
        return {HealthStatus::Level::Degraded, "audio engine not running while recording"};
    }
    return {HealthStatus::Level::Healthy, {}};
}

void AudioCaptureSession::log(const std::string& msg) {
    if (opts_.verbose) {
        std::println(stderr, "[voice-ledger] capture: {}", msg);
    }
}
