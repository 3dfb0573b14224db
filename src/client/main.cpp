#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

// Transcription and model downloads can take minutes.
static constexpr std::chrono::minutes LONG_TIMEOUT{10};

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                 Start recording");
    std::println(stderr, "  stop                  Stop recording and print the transcript");
    std::println(stderr, "  toggle                Start, or stop and transcribe");
    std::println(stderr, "  cancel                Discard the current recording");
    std::println(stderr, "  reset                 Clear a finished or failed session");
    std::println(stderr, "  status                Show session and model state");
    std::println(stderr, "  watch                 Print every state change until interrupted");
    std::println(stderr, "  model [NAME]          Show or switch the speech model");
    std::println(stderr, "  models                List available models");
    std::println(stderr, "  history [--limit N]   Show transcription history");
    std::println(stderr, "  recordings            List kept recordings");
    std::println(stderr, "  delete PATH           Delete a recording");
}

static void print_session(const json& s) {
    auto state = s.value("state", "unknown");
    if (state == "recording") {
        std::println("State: recording ({:.1f}s)", s.value("elapsed", 0.0));
    } else if (state == "processing") {
        std::println("State: processing {}", s.value("audio_path", ""));
    } else if (state == "completed") {
        std::println("State: completed ({:.1f}s audio, {:.1f}s processing)",
                     s.value("duration", 0.0), s.value("processing_time", 0.0));
        std::println("{}", s.value("text", ""));
    } else if (state == "failed") {
        std::println("State: failed [{}] {}", s.value("kind", ""), s.value("message", ""));
    } else {
        std::println("State: {}", state);
    }
}

static void print_model(const json& m) {
    auto state = m.value("state", "unknown");
    if (state == "failed") {
        std::println("Model: failed: {}", m.value("message", ""));
    } else if (m.contains("name")) {
        std::println("Model: {} ({})", m.value("name", ""), state);
    } else {
        std::println("Model: {}", state);
    }
}

static int run_watch(UnixSocketClient& client) {
    while (auto line = client.next_line(IpcClient::NO_TIMEOUT)) {
        if (line->value("event", "") != "state") continue;
        print_session((*line)["session"]);
        print_model((*line)["model"]);
        std::fflush(stdout);
    }
    std::println(stderr, "Connection to daemon closed");
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string positional;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (positional.empty()) {
            positional = arg;
        }
    }

    json cmd;
    std::chrono::milliseconds timeout{30000};
    if (command == "start" || command == "cancel" || command == "reset" ||
        command == "status" || command == "watch" || command == "models" ||
        command == "recordings") {
        cmd = {{"cmd", command}};
    } else if (command == "stop" || command == "toggle") {
        cmd = {{"cmd", command}};
        timeout = LONG_TIMEOUT;
    } else if (command == "model") {
        cmd = {{"cmd", "model"}};
        if (!positional.empty()) {
            cmd["name"] = positional;
            timeout = LONG_TIMEOUT;
        }
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "delete") {
        if (positional.empty()) {
            std::println(stderr, "delete requires a path");
            return 1;
        }
        cmd = {{"cmd", "delete"}, {"path", positional}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is pocket-scribed running?");
        return 1;
    }

    if (!client.send_line(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    auto reply = client.next_line(timeout);
    if (!reply) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    json& response = *reply;

    auto status = response.value("status", "");

    if (status == "error") {
        auto kind = response.value("kind", "");
        if (kind.empty()) {
            std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        } else {
            std::println(stderr, "Error [{}]: {}", kind, response.value("message", "unknown error"));
        }
        return 1;
    }

    if (command == "watch") {
        print_session(response["session"]);
        print_model(response["model"]);
        std::fflush(stdout);
        return run_watch(client);
    }

    if (command == "status") {
        print_session(response);
        print_model(response["model"]);
        std::println("Engine: {}, language: {}", response.value("engine", ""),
                     response.value("language", ""));
    } else if (command == "model") {
        print_model(response["model"]);
    } else if (command == "models") {
        for (auto& m : response["models"]) {
            std::println("{} {:<10} {:>8}{}", m.value("current", false) ? '*' : ' ',
                         m.value("name", ""), m.value("size", ""),
                         m.value("cached", false) ? "  cached" : "");
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
            if (!entry.value("model", "").empty()) {
                std::println("  {} via {}, {:.1f}s audio", entry.value("model", ""),
                             entry.value("engine", ""), entry.value("audio_duration", 0.0));
            }
        }
    } else if (command == "recordings") {
        for (auto& r : response["recordings"]) {
            std::println("{}  {} bytes", r.value("path", ""), r.value("size_bytes", uint64_t{0}));
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
