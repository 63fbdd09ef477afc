#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* app_name = "meetmate";

// XDG base directory lookup; an unset or empty variable falls back to
// $HOME/<home_suffix>.
std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/" + app_name;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_suffix + "/" + app_name;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/" + app_name + ".sock";
    return std::string("/tmp/") + app_name + ".sock";
}

} // namespace platform
