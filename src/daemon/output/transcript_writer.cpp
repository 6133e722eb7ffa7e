#include "output/transcript_writer.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace transcript {

namespace {

Result<std::string> write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return make_error(ErrorKind::TransientIO, "cannot open " + path.string() + " for writing");
    }
    f << content;
    f.close();
    if (!f) {
        return make_error(ErrorKind::TransientIO, "failed writing " + path.string());
    }
    return path.string();
}

} // namespace

std::string format_timestamp(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    auto total_ms = static_cast<long long>(std::llround(seconds * 1000.0));
    auto hours = total_ms / 3'600'000;
    total_ms %= 3'600'000;
    auto minutes = total_ms / 60'000;
    total_ms %= 60'000;
    auto secs = total_ms / 1000;
    auto millis = total_ms % 1000;
    return std::format("{:02}:{:02}:{:02},{:03}", hours, minutes, secs, millis);
}

std::string render_plaintext(const std::vector<Segment>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        out += std::format("[{} --> {}] {}\n", format_timestamp(seg.start_sec),
                           format_timestamp(seg.end_sec), seg.text);
    }
    return out;
}

std::string render_srt(const std::vector<Segment>& segments) {
    std::string out;
    size_t index = 1;
    for (const auto& seg : segments) {
        out += std::format("{}\n{} --> {}\n{}\n\n", index++, format_timestamp(seg.start_sec),
                           format_timestamp(seg.end_sec), seg.text);
    }
    return out;
}

std::string render_json(const std::vector<Segment>& segments, const std::string& generated_at) {
    nlohmann::json payload = {
        {"generated_at", generated_at},
        {"segments", segments},
    };
    return payload.dump(2) + "\n";
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

Result<std::vector<std::string>> write_artifacts(const std::vector<Segment>& segments,
                                                 const std::string& output_dir, bool with_srt) {
    if (output_dir.empty()) {
        return make_error(ErrorKind::InvalidRequest, "output_dir is required");
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return make_error(ErrorKind::TransientIO,
                          "cannot create " + output_dir + ": " + ec.message());
    }

    fs::path root(output_dir);
    std::vector<std::string> written;

    auto json_path = write_file(root / "segments.json", render_json(segments, now_iso8601()));
    if (!json_path) return std::unexpected(json_path.error());
    written.push_back(*json_path);

    auto txt_path = write_file(root / "transcript.txt", render_plaintext(segments));
    if (!txt_path) return std::unexpected(txt_path.error());
    written.push_back(*txt_path);

    if (with_srt) {
        auto srt_path = write_file(root / "subtitles.srt", render_srt(segments));
        if (!srt_path) return std::unexpected(srt_path.error());
        written.push_back(*srt_path);
    }

    return written;
}

} // namespace transcript
