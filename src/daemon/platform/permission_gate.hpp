#pragma once

#include <string_view>

enum class PermissionStatus { Granted, Denied, PermanentlyDenied };

inline std::string_view to_string(PermissionStatus status) {
    switch (status) {
        case PermissionStatus::Granted: return "granted";
        case PermissionStatus::Denied: return "denied";
        case PermissionStatus::PermanentlyDenied: return "permanently_denied";
    }
    return "unknown";
}

// Microphone capability. Results are never cached: every check-then-act
// sequence queries again.
class PermissionGate {
public:
    virtual ~PermissionGate() = default;
    // Side-effect-free query.
    virtual PermissionStatus check() const = 0;
    // May prompt the user. On PermanentlyDenied also calls open_settings().
    virtual PermissionStatus request() = 0;
    virtual void open_settings() = 0;
};
