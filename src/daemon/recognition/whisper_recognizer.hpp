#pragma once

#include "capture/sample_queue.hpp"
#include "recognition/recognizer.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <vector>

// Audio sink backed by a lock-free sample queue so the audio thread never waits.
class BufferedRecognitionRequest : public RecognitionRequest {
public:
    BufferedRecognitionRequest(size_t max_samples, bool partial_results);

    void append(std::span<const int16_t> samples) override;
    void end_audio() override;
    bool partial_results() const override { return partial_results_; }

    bool ended() const { return ended_.load(std::memory_order_acquire); }
    size_t dropped_samples() const { return queue_.dropped(); }

    // Blocks until end_audio(), a stop request, or the timeout. Returns ended().
    bool wait(std::stop_token stop, std::chrono::milliseconds timeout);
    size_t drain_into(std::vector<int16_t>& out) { return queue_.drain_into(out); }

private:
    SampleQueue queue_;
    bool partial_results_;
    std::atomic<bool> ended_{false};
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

// Streaming recognition over a batch whisper server: the accumulated audio is
// re-transcribed periodically for partial results, and once more after
// end_audio() for the final transcript.
class WhisperRecognizer : public SpeechRecognizer {
public:
    struct Options {
        uint32_t sample_rate = 16000;
        size_t max_samples = 120 * 16000;
        std::chrono::milliseconds partial_interval{1000};
        bool verbose = false;
    };

    WhisperRecognizer(WhisperBackend& backend, Options opts);

    bool is_available() const override;
    std::shared_ptr<RecognitionRequest> make_request(bool partial_results) override;
    std::unique_ptr<RecognitionTask> start_task(std::shared_ptr<RecognitionRequest> request,
                                                ResultHandler handler) override;

private:
    WhisperBackend& backend_;
    Options opts_;
};
