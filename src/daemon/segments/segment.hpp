#pragma once

#include <nlohmann/json.hpp>
#include <string>

struct Segment {
    std::string text;
    double start_sec = 0.0;
    double end_sec = 0.0;

    bool operator==(const Segment&) const = default;
};

inline void to_json(nlohmann::json& j, const Segment& s) {
    j = {{"text", s.text}, {"start_sec", s.start_sec}, {"end_sec", s.end_sec}};
}

inline void from_json(const nlohmann::json& j, Segment& s) {
    s.text = j.value("text", "");
    s.start_sec = j.value("start_sec", 0.0);
    s.end_sec = j.value("end_sec", 0.0);
}
