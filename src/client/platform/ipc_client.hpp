#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Client side of the daemon's newline-delimited JSON protocol.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits up to timeout_ms for the next response line.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
