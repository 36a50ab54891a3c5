#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

struct BackendError {
    bool unreachable = false; // connection-level failure, as opposed to a bad answer
    bool cancelled = false;
    std::string message;
};

// Batch speech-to-text: one request per call, whole utterance in, text out.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<TranscriptResult, BackendError>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   std::stop_token stop = {}) = 0;
    // Cheap reachability probe.
    virtual bool available() const = 0;
};
