#include "download/status_stream.hpp"

#include <thread>

DownloadStatusStream::DownloadStatusStream(const DownloadManager& downloads, std::string model_id,
                                           std::chrono::milliseconds interval)
    : downloads_(downloads), model_id_(std::move(model_id)), interval_(interval) {}

std::optional<nlohmann::json> DownloadStatusStream::poll() {
    if (finished_) return std::nullopt;

    auto state = downloads_.find(model_id_);
    if (!state) {
        finished_ = true;
        return nlohmann::json{
            {"status", "error"},
            {"kind", "NotFound"},
            {"message", "Model " + model_id_ + " not found"},
        };
    }

    if (state->terminal()) finished_ = true;

    if (last_state_ == state->state && last_progress_ == state->progress) {
        return std::nullopt;
    }
    last_state_ = state->state;
    last_progress_ = state->progress;

    return nlohmann::json{
        {"status", "ok"},
        {"event", "progress"},
        {"download", *state},
    };
}

std::optional<nlohmann::json> DownloadStatusStream::next() {
    while (!finished_) {
        if (auto event = poll()) return event;
        std::this_thread::sleep_for(interval_);
    }
    return std::nullopt;
}
