#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/voice-ledger, falling back to ~/.config/voice-ledger.
std::string config_dir();
// $XDG_DATA_HOME/voice-ledger, falling back to ~/.local/share/voice-ledger.
std::string data_dir();
// Unix socket path shared by the daemon and vlctl.
std::string ipc_endpoint();

} // namespace platform
