#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON over a local stream socket: one command line in, one
// response line out. A client may stay connected for several exchanges.
class IpcServer {
public:
    enum class ReadStatus {
        Command,    // cmd holds the next complete command
        Incomplete, // partial line buffered, wait for more data
        Invalid,    // a line arrived that is not a JSON object
        Closed,     // peer hung up or the socket failed
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
