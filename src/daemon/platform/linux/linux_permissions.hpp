#pragma once

#include "platform/permissions.hpp"

#include <string>

// Microphone access follows the PipeWire socket; transcription is a config
// opt-in since audio leaves the machine for the recognition server.
class LinuxPermissions : public PermissionProvider {
public:
    explicit LinuxPermissions(bool allow_transcription);

    bool microphone_granted() const override;
    bool speech_granted() const override { return allow_transcription_; }

    static std::string pipewire_socket_path();

private:
    bool allow_transcription_;
};
