#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

std::string xdg_path(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/pocket-scribe";
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_fallback + "/pocket-scribe";
}

} // namespace

std::string config_dir() {
    return xdg_path("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_path("XDG_DATA_HOME", "/.local/share");
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return xdg;
    return "/run/user/" + std::to_string(::getuid());
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/pocket-scribe.sock";
    return "/tmp/pocket-scribe.sock";
}

} // namespace platform
