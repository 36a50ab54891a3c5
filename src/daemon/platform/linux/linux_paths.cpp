#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppDir = "voice-ledger";

// $<env>/voice-ledger, else $HOME/<home_fallback>/voice-ledger.
std::string xdg_dir(const char* env, const char* home_fallback) {
    if (const char* xdg = std::getenv(env); xdg && *xdg) {
        return std::string(xdg) + "/" + kAppDir;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_fallback + "/" + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    if (const char* override_path = std::getenv("VOICE_LEDGER_SOCKET"); override_path && *override_path) {
        return override_path;
    }
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::string(xdg) + "/voice-ledger.sock";
    }
    return "/tmp/voice-ledger.sock";
}

} // namespace platform
