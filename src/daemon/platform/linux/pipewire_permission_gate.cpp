#include "platform/linux/pipewire_permission_gate.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

PipeWirePermissionGate::PipeWirePermissionGate(std::string runtime_dir,
                                               std::string settings_command)
    : runtime_dir_(std::move(runtime_dir)), settings_command_(std::move(settings_command)) {}

std::vector<std::string> PipeWirePermissionGate::socket_paths() const {
    return {
        runtime_dir_ + "/pipewire-0",
        runtime_dir_ + "/pulse/native",
    };
}

PermissionStatus PipeWirePermissionGate::check() const {
    bool refused = false;
    for (const auto& path : socket_paths()) {
        if (::access(path.c_str(), R_OK | W_OK) == 0) {
            return PermissionStatus::Granted;
        }
        if (errno == EACCES || errno == EPERM) {
            refused = true;
        }
    }
    return refused ? PermissionStatus::PermanentlyDenied : PermissionStatus::Denied;
}

PermissionStatus PipeWirePermissionGate::request() {
    auto status = check();
    if (status == PermissionStatus::PermanentlyDenied) {
        std::println(stderr, "permission: audio server socket in {} not accessible", runtime_dir_);
        open_settings();
    } else if (status == PermissionStatus::Denied) {
        std::println(stderr, "permission: no audio server socket in {}", runtime_dir_);
    }
    return status;
}

void PipeWirePermissionGate::open_settings() {
    if (settings_command_.empty()) return;

    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "permission: fork() failed: {}", std::strerror(errno));
        return;
    }

    if (pid == 0) {
        // Intermediate child: detach and let the grandchild be reparented.
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) ::_exit(grandchild < 0 ? 1 : 0);
        ::execlp("/bin/sh", "sh", "-c", settings_command_.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        std::println(stderr, "permission: waitpid() failed: {}", std::strerror(errno));
        return;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        std::println(stderr, "permission: could not launch '{}'", settings_command_);
    }
}
