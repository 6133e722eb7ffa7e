#pragma once

#include "errors.hpp"
#include "segments/segment.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class TaskState { Queued, Processing, Completed, Failed };

inline std::string_view to_string(TaskState s) {
    switch (s) {
        case TaskState::Queued: return "queued";
        case TaskState::Processing: return "processing";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

struct Task {
    std::string id;
    std::string audio_path;
    TaskState state = TaskState::Queued;
    double progress = 0.0;

    std::vector<Segment> segments;
    nlohmann::json raw;
    std::string text;
    std::vector<std::string> warnings;

    std::optional<std::string> error;
    std::optional<ErrorKind> error_kind;

    nlohmann::json metadata = nlohmann::json::object();
    double processing_time = 0.0;

    bool terminal() const {
        return state == TaskState::Completed || state == TaskState::Failed;
    }
};

inline void to_json(nlohmann::json& j, const Task& t) {
    j = {
        {"id", t.id},
        {"audio_path", t.audio_path},
        {"state", std::string(to_string(t.state))},
        {"progress", t.progress},
        {"metadata", t.metadata},
    };
    if (t.state == TaskState::Completed) {
        j["result"] = {
            {"segments", t.segments},
            {"text", t.text},
            {"raw", t.raw},
        };
        j["processing_time"] = t.processing_time;
    }
    if (!t.warnings.empty()) j["warnings"] = t.warnings;
    if (t.error) j["error"] = *t.error;
    if (t.error_kind) j["error_kind"] = std::string(to_string(*t.error_kind));
}
