#include "recognition/whisper_recognizer.hpp"

#include <print>
#include <thread>

namespace {

class WhisperTask : public RecognitionTask {
public:
    WhisperTask(WhisperBackend& backend, std::shared_ptr<BufferedRecognitionRequest> request,
                SpeechRecognizer::ResultHandler handler, WhisperRecognizer::Options opts)
        : backend_(backend), request_(std::move(request)), handler_(std::move(handler)),
          opts_(opts), worker_([this](std::stop_token st) { run(st); }) {}

    ~WhisperTask() override { cancel(); }

    void cancel() override {
        if (worker_.joinable()) {
            worker_.request_stop();
            worker_.join();
        }
    }

private:
    void run(std::stop_token st) {
        std::vector<int16_t> audio;
        size_t transcribed = 0;
        const size_t min_new_samples = opts_.sample_rate / 2;

        while (!st.stop_requested()) {
            bool ended = request_->wait(st, opts_.partial_interval);
            if (st.stop_requested()) break;

            request_->drain_into(audio);
            if (ended) {
                finish(audio, st);
                return;
            }

            if (request_->partial_results() && audio.size() >= transcribed + min_new_samples) {
                auto r = backend_.transcribe(audio, opts_.sample_rate, st);
                if (r && !r->text.empty()) {
                    handler_(Transcript{.text = r->text, .is_final = false});
                } else if (!r && !r.error().cancelled) {
                    log("partial transcription failed: " + r.error().message);
                }
                transcribed = audio.size();
            }
        }

        handler_(RecognitionError{
            .domain = std::string(recognition_error::kRequestDomain),
            .code = recognition_error::kRequestCanceled,
            .message = "recognition request was canceled",
        });
    }

    void finish(const std::vector<int16_t>& audio, std::stop_token st) {
        using namespace recognition_error;

        if (audio.empty()) {
            handler_(RecognitionError{std::string(kAssistantDomain), kNoSpeechDetected,
                                      "no speech detected"});
            return;
        }

        auto r = backend_.transcribe(audio, opts_.sample_rate, st);
        if (!r) {
            if (r.error().cancelled) {
                handler_(RecognitionError{std::string(kRequestDomain), kRequestCanceled,
                                          "recognition request was canceled"});
            } else {
                handler_(RecognitionError{std::string(kBackendDomain),
                                          r.error().unreachable ? kBackendUnreachable
                                                                : kBackendFailed,
                                          r.error().message});
            }
            return;
        }

        if (r->text.empty()) {
            handler_(RecognitionError{std::string(kAssistantDomain), kNoSpeechDetected,
                                      "no speech detected"});
            return;
        }

        if (request_->dropped_samples() > 0) {
            log("recognizer: " + std::to_string(request_->dropped_samples()) +
                " samples dropped, recording exceeded the buffer");
        }
        handler_(Transcript{.text = std::move(r->text), .is_final = true});
    }

    void log(const std::string& msg) {
        if (opts_.verbose) {
            std::println(stderr, "[voice-ledger] {}", msg);
        }
    }

    WhisperBackend& backend_;
    std::shared_ptr<BufferedRecognitionRequest> request_;
    SpeechRecognizer::ResultHandler handler_;
    WhisperRecognizer::Options opts_;
    std::jthread worker_;
};

} // namespace

BufferedRecognitionRequest::BufferedRecognitionRequest(size_t max_samples, bool partial_results)
    : queue_(max_samples), partial_results_(partial_results) {}

void BufferedRecognitionRequest::append(std::span<const int16_t> samples) {
    if (ended_.load(std::memory_order_relaxed)) return;
    queue_.push(samples);
}

void BufferedRecognitionRequest::end_audio() {
    {
        std::lock_guard lock(mutex_);
        ended_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool BufferedRecognitionRequest::wait(std::stop_token stop, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, stop, timeout, [this] { return ended(); });
}

WhisperRecognizer::WhisperRecognizer(WhisperBackend& backend, Options opts)
    : backend_(backend), opts_(opts) {}

bool WhisperRecognizer::is_available() const {
    return backend_.available();
}

std::shared_ptr<RecognitionRequest> WhisperRecognizer::make_request(bool partial_results) {
    return std::make_shared<BufferedRecognitionRequest>(opts_.max_samples, partial_results);
}

std::unique_ptr<RecognitionTask>
WhisperRecognizer::start_task(std::shared_ptr<RecognitionRequest> request, ResultHandler handler) {
    auto buffered = std::dynamic_pointer_cast<BufferedRecognitionRequest>(request);
    if (!buffered) {
        std::println(stderr, "recognizer: request was not created by this recognizer");
        return nullptr;
    }
    return std::make_unique<WhisperTask>(backend_, std::move(buffered), std::move(handler), opts_);
}
