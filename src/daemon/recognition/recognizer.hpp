#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>

struct Transcript {
    std::string text;
    bool is_final = false;
};

struct RecognitionError {
    std::string domain;
    int code = 0;
    std::string message;
};

namespace recognition_error {

// Errors raised by the request itself.
inline constexpr std::string_view kRequestDomain = "recognition.request";
inline constexpr int kRequestCanceled = 301;

// Errors raised by the recognition service.
inline constexpr std::string_view kAssistantDomain = "recognition.assistant";
inline constexpr int kAssistantInternal = 1101;
inline constexpr int kNoSpeechDetected = 1110;

// Errors raised while talking to the transcription backend.
inline constexpr std::string_view kBackendDomain = "recognition.backend";
inline constexpr int kBackendUnreachable = 203;
inline constexpr int kBackendFailed = 500;

} // namespace recognition_error

// Audio sink of one recognition session.
class RecognitionRequest {
public:
    virtual ~RecognitionRequest() = default;
    // Called on the audio thread. Must not block.
    virtual void append(std::span<const int16_t> samples) = 0;
    // No more audio will follow; the recognizer finishes what it has.
    virtual void end_audio() = 0;
    virtual bool partial_results() const = 0;
};

class RecognitionTask {
public:
    virtual ~RecognitionTask() = default;
    // Stops the task. A task that had not delivered its terminal event reports
    // kRequestCanceled. No handler call is running once cancel() returns.
    virtual void cancel() = 0;
};

class SpeechRecognizer {
public:
    using Event = std::variant<Transcript, RecognitionError>;
    // Called 0..N times with partial transcripts, then exactly once with a final
    // transcript or an error. Runs on a recognizer thread.
    using ResultHandler = std::function<void(Event)>;

    virtual ~SpeechRecognizer() = default;
    // May block on the network; keep it off the owner thread.
    virtual bool is_available() const = 0;
    virtual std::shared_ptr<RecognitionRequest> make_request(bool partial_results) = 0;
    virtual std::unique_ptr<RecognitionTask> start_task(std::shared_ptr<RecognitionRequest> request,
                                                        ResultHandler handler) = 0;
};
