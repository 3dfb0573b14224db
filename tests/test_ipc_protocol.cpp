#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ps_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server until `count` commands arrived or the client hung up.
std::optional<std::vector<json>> read_n(UnixSocketServer& server, int fd, size_t count) {
    std::vector<json> all;
    for (int i = 0; i < 200 && all.size() < count; ++i) {
        auto got = server.read_commands(fd);
        if (!got) return std::nullopt;
        all.insert(all.end(), got->begin(), got->end());
        if (all.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return all;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        REQUIRE(server.server_fd() >= 0);
        REQUIRE(server.client_count() == 0);
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RejectsOverlongPath") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send_line({{"cmd", "status"}}));

        auto received = read_n(server, client_fd, 1);
        REQUIRE(received.has_value());
        REQUIRE(received->size() == 1);
        REQUIRE((*received)[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        auto resp = client.next_line(1000ms);
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralCommandsInOneRead") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send_line({{"cmd", "status"}, {"seq", i}}));
        }

        auto received = read_n(server, client_fd, 5);
        REQUIRE(received.has_value());
        REQUIRE(received->size() == 5);
        for (int i = 0; i < 5; ++i) REQUIRE((*received)[i]["seq"] == i);

        server.stop();
    }

    SECTION("ClientBuffersBurstOfEvents") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Three lines likely arrive in a single recv on the client side
        for (int i = 0; i < 3; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "state"}, {"seq", i}}));
        }

        for (int i = 0; i < 3; ++i) {
            auto line = client.next_line(1000ms);
            REQUIRE(line.has_value());
            REQUIRE((*line)["seq"] == i);
        }

        server.stop();
    }

    SECTION("PartialLineWaitsForNewline") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Raw write without the trailing newline, through a second socket to the same server
        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        int raw_fd = server.accept_client();
        REQUIRE(raw_fd >= 0);

        std::string half = R"({"cmd":"sta)";
        REQUIRE(::send(raw, half.data(), half.size(), 0) == static_cast<ssize_t>(half.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto first = server.read_commands(raw_fd);
        REQUIRE(first.has_value());
        REQUIRE(first->empty());

        std::string rest = "tus\"}\n";
        REQUIRE(::send(raw, rest.data(), rest.size(), 0) == static_cast<ssize_t>(rest.size()));
        auto done = read_n(server, raw_fd, 1);
        REQUIRE(done.has_value());
        REQUIRE(done->size() == 1);
        REQUIRE((*done)[0]["cmd"] == "status");

        ::close(raw);
        server.stop();
    }

    SECTION("MalformedLineBecomesUnknownCommand") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        int raw_fd = server.accept_client();
        REQUIRE(raw_fd >= 0);

        std::string junk = "not json\n";
        REQUIRE(::send(raw, junk.data(), junk.size(), 0) == static_cast<ssize_t>(junk.size()));
        auto got = read_n(server, raw_fd, 1);
        REQUIRE(got.has_value());
        REQUIRE(got->size() == 1);
        REQUIRE((*got)[0]["cmd"].is_null());

        ::close(raw);
        server.stop();
    }

    SECTION("CommandBeforeHalfCloseIsDelivered") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        int raw_fd = server.accept_client();
        REQUIRE(raw_fd >= 0);

        std::string line = "{\"cmd\":\"status\"}\n";
        REQUIRE(::send(raw, line.data(), line.size(), 0) == static_cast<ssize_t>(line.size()));
        REQUIRE(::shutdown(raw, SHUT_WR) == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        auto got = server.read_commands(raw_fd);
        REQUIRE(got.has_value());
        REQUIRE(got->size() == 1);
        REQUIRE((*got)[0]["cmd"] == "status");

        // The reply still reaches a half-closed peer
        REQUIRE(server.send_response(raw_fd, {{"status", "ok"}}));
        char reply[64];
        REQUIRE(::recv(raw, reply, sizeof(reply), 0) > 0);

        REQUIRE_FALSE(server.read_commands(raw_fd).has_value());

        ::close(raw);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE_FALSE(server.read_commands(client_fd).has_value());

        server.close_client(client_fd);
        REQUIRE(server.client_count() == 0);
        server.stop();
    }

    SECTION("ClientFailsWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
        REQUIRE_FALSE(client.connected());
        REQUIRE_FALSE(client.next_line(10ms).has_value());
    }
}
