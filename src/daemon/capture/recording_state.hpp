#pragma once

#include <chrono>
#include <string>

struct RecordingState {
    enum class Kind { Idle, Recording, Processing, Completed, Error };

    Kind kind = Kind::Idle;
    std::string message; // set for Error only

    static RecordingState idle() { return {Kind::Idle, {}}; }
    static RecordingState recording() { return {Kind::Recording, {}}; }
    static RecordingState processing() { return {Kind::Processing, {}}; }
    static RecordingState completed() { return {Kind::Completed, {}}; }
    static RecordingState error(std::string msg) { return {Kind::Error, std::move(msg)}; }

    bool is_recording() const { return kind == Kind::Recording; }
    bool operator==(const RecordingState&) const = default;
};

inline const char* to_string(RecordingState::Kind kind) {
    switch (kind) {
        case RecordingState::Kind::Idle: return "idle";
        case RecordingState::Kind::Recording: return "recording";
        case RecordingState::Kind::Processing: return "processing";
        case RecordingState::Kind::Completed: return "completed";
        case RecordingState::Kind::Error: return "error";
    }
    return "unknown";
}

struct VoiceRecording {
    std::string text;
    double duration_s = 0.0;
    std::chrono::system_clock::time_point started_at;
};
