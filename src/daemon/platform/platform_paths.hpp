#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();

// Default root for downloaded model snapshots.
std::string model_cache_dir();

} // namespace platform
