#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class DownloadStatus { Pending, Downloading, Completed, Failed };

inline std::string_view to_string(DownloadStatus s) {
    switch (s) {
        case DownloadStatus::Pending: return "pending";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::Failed: return "failed";
    }
    return "unknown";
}

struct DownloadState {
    std::string model_id;
    DownloadStatus state = DownloadStatus::Pending;
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    double progress = 0.0; // percent, 0-100
    std::optional<std::string> download_path;
    std::optional<std::string> error;

    bool terminal() const {
        return state == DownloadStatus::Completed || state == DownloadStatus::Failed;
    }
};

inline void to_json(nlohmann::json& j, const DownloadState& s) {
    j = {
        {"model_id", s.model_id},
        {"state", std::string(to_string(s.state))},
        {"progress", s.progress},
        {"downloaded_bytes", s.downloaded_bytes},
        {"total_bytes", s.total_bytes},
        {"download_path", s.download_path ? nlohmann::json(*s.download_path) : nlohmann::json()},
        {"error", s.error ? nlohmann::json(*s.error) : nlohmann::json()},
    };
}
