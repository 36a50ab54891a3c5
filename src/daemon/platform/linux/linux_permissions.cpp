#include "platform/linux/linux_permissions.hpp"

#include <cstdlib>
#include <unistd.h>

LinuxPermissions::LinuxPermissions(bool allow_transcription)
    : allow_transcription_(allow_transcription) {}

bool LinuxPermissions::microphone_granted() const {
    auto path = pipewire_socket_path();
    if (path.empty()) return false;
    return ::access(path.c_str(), R_OK | W_OK) == 0;
}

std::string LinuxPermissions::pipewire_socket_path() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (!runtime || !*runtime) return {};

    const char* remote = std::getenv("PIPEWIRE_REMOTE");
    if (remote && *remote) {
        if (remote[0] == '/') return remote;
        return std::string(runtime) + "/" + remote;
    }
    return std::string(runtime) + "/pipewire-0";
}
