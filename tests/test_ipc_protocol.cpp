#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using ReadStatus = IpcServer::ReadStatus;

namespace {

std::string tmp_socket_path() {
    return "/tmp/vl_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server socket is non-blocking, so poll briefly until something other than
// Incomplete comes back.
ReadStatus read_next(UnixSocketServer& server, int fd, json& cmd) {
    ReadStatus status = ReadStatus::Incomplete;
    for (int i = 0; i < 100; ++i) {
        status = server.read_command(fd, cmd);
        if (status != ReadStatus::Incomplete) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return status;
}

// Plain connected socket for writing raw bytes.
int raw_connect(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_send(int fd, const std::string& bytes) {
    ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL);
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        REQUIRE(server.server_fd() >= 0);
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("SocketIsOwnerOnly") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        auto perms = std::filesystem::status(sock_path).permissions();
        REQUIRE((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none);
        REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"command", "status"}}));

        json received;
        REQUIRE(read_next(server, client_fd, received) == ReadStatus::Command);
        REQUIRE(received["command"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"step", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["step"] == "idle");

        server.close_client(client_fd);
    }

    SECTION("SeveralExchangesOnOneConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"command", "history"}, {"limit", i + 1}}));

            json received;
            REQUIRE(read_next(server, client_fd, received) == ReadStatus::Command);
            REQUIRE(received["limit"] == i + 1);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }
    }

    SECTION("TwoLinesInOnePacket") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"command\":\"start\"}\n{\"command\":\"stop\",\"wait\":true}\n");

        json first;
        REQUIRE(read_next(server, client_fd, first) == ReadStatus::Command);
        REQUIRE(first["command"] == "start");

        json second;
        REQUIRE(server.read_command(client_fd, second) == ReadStatus::Command);
        REQUIRE(second["command"] == "stop");
        REQUIRE(second["wait"] == true);

        ::close(raw);
    }

    SECTION("PartialLineWaitsForRest") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"command\":");
        json cmd;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Incomplete);

        raw_send(raw, "\"status\"}\n");
        REQUIRE(read_next(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["command"] == "status");

        ::close(raw);
    }

    SECTION("InvalidLineReported") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "not json\n[1,2]\n{\"command\":\"status\"}\n");

        json cmd;
        REQUIRE(read_next(server, client_fd, cmd) == ReadStatus::Invalid);
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Invalid);
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["command"] == "status");

        ::close(raw);
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_next(server, client_fd, cmd) == ReadStatus::Closed);
        server.close_client(client_fd);
    }

    SECTION("UnknownFdIsClosed") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        json cmd;
        REQUIRE(server.read_command(12345, cmd) == ReadStatus::Closed);
    }

    SECTION("ClientRecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));
    }

    SECTION("ClientWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/vl_test_no_such_socket.sock"));
        REQUIRE_FALSE(client.send({{"command", "status"}}));
    }
}
