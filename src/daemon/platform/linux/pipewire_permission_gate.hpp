#pragma once

#include "platform/permission_gate.hpp"

#include <string>
#include <vector>

// Microphone access on a PipeWire desktop is access to the audio server's
// socket in the runtime dir. There is no prompt to show, so request() only
// re-checks and points the user at the mixer when access is refused.
class PipeWirePermissionGate : public PermissionGate {
public:
    PipeWirePermissionGate(std::string runtime_dir, std::string settings_command);

    PermissionStatus check() const override;
    PermissionStatus request() override;
    void open_settings() override;

    // Candidate sockets in the order they are checked.
    std::vector<std::string> socket_paths() const;

private:
    std::string runtime_dir_;
    std::string settings_command_;
};
