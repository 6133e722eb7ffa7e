#pragma once

#include "errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace http {

struct Options {
    long timeout_s = 120;
    long connect_timeout_s = 10;
    // Abort when less than 1 byte/s arrives for this long. 0 disables.
    long low_speed_time_s = 0;
};

// Called with the number of bytes received since the previous call.
// Returning false aborts the transfer.
using ByteCallback = std::function<bool(uint64_t bytes)>;

// RAII curl_global_init/cleanup. Hold one per component that talks HTTP.
class GlobalInit {
public:
    GlobalInit();
    ~GlobalInit();

    GlobalInit(const GlobalInit&) = delete;
    GlobalInit& operator=(const GlobalInit&) = delete;
};

Result<nlohmann::json> post_json(const std::string& url, const nlohmann::json& body,
                                 const Options& opts);

Result<nlohmann::json> get_json(const std::string& url, const Options& opts);

// Streams url into dest, creating parent directories. on_bytes is also
// polled with 0 while the transfer is idle. An aborted transfer yields
// DownloadCancelled and removes the partial file.
Result<void> download_file(const std::string& url, const std::filesystem::path& dest,
                           const ByteCallback& on_bytes, const Options& opts);

std::string escape(const std::string& s);

} // namespace http
