#pragma once

#include "download/download_manager.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Live feed of one model's download state. Emits an event only when the
// state or progress changed since the last event, and ends after a
// completed/failed event. An unknown model id yields a single error event.
//
// Events are IPC-ready:
//   {"status": "ok", "event": "progress", "download": {...}}
//   {"status": "error", "kind": "NotFound", "message": "..."}
class DownloadStatusStream {
public:
    DownloadStatusStream(const DownloadManager& downloads, std::string model_id,
                         std::chrono::milliseconds interval = std::chrono::milliseconds(500));

    // Non-blocking. Returns the next event if there is one right now.
    std::optional<nlohmann::json> poll();

    // Blocks, sampling every interval, until an event is due. Returns
    // nullopt once the stream has finished.
    std::optional<nlohmann::json> next();

    bool finished() const { return finished_; }
    const std::string& model_id() const { return model_id_; }

private:
    const DownloadManager& downloads_;
    std::string model_id_;
    std::chrono::milliseconds interval_;

    std::optional<DownloadStatus> last_state_;
    double last_progress_ = -1.0;
    bool finished_ = false;
};
