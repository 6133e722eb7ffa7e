#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/longscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/longscribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/longscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/longscribe";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/longscribe.sock";
    return "/tmp/longscribe.sock";
}

std::string model_cache_dir() {
    const char* override_dir = std::getenv("MODELSCOPE_CACHE");
    if (override_dir && *override_dir) return std::string(override_dir) + "/hub/models";
    const char* home = std::getenv("HOME");
    if (!home) return "/tmp/modelscope/hub/models";
    return std::string(home) + "/.cache/modelscope/hub/models";
}

} // namespace platform
