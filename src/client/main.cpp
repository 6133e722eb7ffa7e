#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr int kDefaultTimeoutMs = 30000;
// Model loads download and warm up weights on the runtime side.
constexpr int kInitializeTimeoutMs = 30 * 60 * 1000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  health                              Show daemon status");
    std::println(stderr, "  init <model> [--device D] [--vad-model M] [--punc-model M]");
    std::println(stderr, "       [--spk-model M] [--max-segment-ms N]");
    std::println(stderr, "                                      Load a model");
    std::println(stderr, "  transcribe <audio> [--speaker] [--batch-size-s N]");
    std::println(stderr, "       [--batch-threshold-s N] [--word-timestamp] [--no-return-stamp]");
    std::println(stderr, "       [--merge-vad] [--merge-length-s N] [--wait]");
    std::println(stderr, "       [--output-dir DIR] [--srt]     Submit a transcription task");
    std::println(stderr, "  task <id>                           Show a task");
    std::println(stderr, "  download <model> [--cache-dir DIR] [--follow]");
    std::println(stderr, "                                      Download model weights");
    std::println(stderr, "  download-status <model>             Show a download");
    std::println(stderr, "  download-progress <model>           Follow a download until it ends");
    std::println(stderr, "  cancel-download <model>             Cancel a running download");
    std::println(stderr, "  history [--limit N]                 Show finished tasks");
}

struct Args {
    std::string command;
    std::vector<std::string> positional;

    std::string device;
    std::optional<std::string> vad_model;
    std::optional<std::string> punc_model;
    std::optional<std::string> spk_model;
    std::optional<long> max_segment_ms;

    bool speaker = false;
    std::optional<double> batch_size_s;
    std::optional<double> batch_threshold_s;
    bool word_timestamp = false;
    bool no_return_stamp = false;
    bool merge_vad = false;
    std::optional<double> merge_length_s;
    bool wait = false;
    std::string output_dir;
    bool srt = false;

    std::string cache_dir;
    bool follow = false;

    int limit = 10;
};

std::optional<double> parse_double(const std::string& s) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return std::nullopt;
    return v;
}

std::optional<Args> parse_args(int argc, char* argv[]) {
    Args a;
    a.command = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires a value", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto number = [&]() -> std::optional<double> {
            auto v = value();
            if (!v) return std::nullopt;
            auto n = parse_double(*v);
            if (!n) std::println(stderr, "{} expects a number, got '{}'", arg, *v);
            return n;
        };

        if (arg == "--device") {
            auto v = value(); if (!v) return std::nullopt; a.device = *v;
        } else if (arg == "--vad-model") {
            a.vad_model = value(); if (!a.vad_model) return std::nullopt;
        } else if (arg == "--punc-model") {
            a.punc_model = value(); if (!a.punc_model) return std::nullopt;
        } else if (arg == "--spk-model") {
            a.spk_model = value(); if (!a.spk_model) return std::nullopt;
        } else if (arg == "--max-segment-ms") {
            auto n = number(); if (!n) return std::nullopt;
            a.max_segment_ms = static_cast<long>(*n);
        } else if (arg == "--speaker") {
            a.speaker = true;
        } else if (arg == "--batch-size-s") {
            a.batch_size_s = number(); if (!a.batch_size_s) return std::nullopt;
        } else if (arg == "--batch-threshold-s") {
            a.batch_threshold_s = number(); if (!a.batch_threshold_s) return std::nullopt;
        } else if (arg == "--word-timestamp") {
            a.word_timestamp = true;
        } else if (arg == "--no-return-stamp") {
            a.no_return_stamp = true;
        } else if (arg == "--merge-vad") {
            a.merge_vad = true;
        } else if (arg == "--merge-length-s") {
            a.merge_length_s = number(); if (!a.merge_length_s) return std::nullopt;
        } else if (arg == "--wait") {
            a.wait = true;
        } else if (arg == "--output-dir") {
            auto v = value(); if (!v) return std::nullopt; a.output_dir = *v;
        } else if (arg == "--srt") {
            a.srt = true;
        } else if (arg == "--cache-dir") {
            auto v = value(); if (!v) return std::nullopt; a.cache_dir = *v;
        } else if (arg == "--follow") {
            a.follow = true;
        } else if (arg == "--limit") {
            auto n = number(); if (!n) return std::nullopt;
            a.limit = static_cast<int>(*n);
        } else if (arg.starts_with("--")) {
            std::println(stderr, "Unknown option: {}", arg);
            return std::nullopt;
        } else {
            a.positional.push_back(arg);
        }
    }
    return a;
}

std::optional<json> request(UnixSocketClient& client, const json& cmd,
                            int timeout_ms = kDefaultTimeoutMs) {
    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return std::nullopt;
    }
    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return std::nullopt;
    }
    return response;
}

bool report_error(const json& response) {
    if (response.value("status", "") != "error") return false;
    auto kind = response.value("kind", "");
    if (kind.empty()) {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
    } else {
        std::println(stderr, "Error ({}): {}", kind, response.value("message", "unknown error"));
    }
    return true;
}

void print_download(const json& d) {
    std::string line = std::format("{}: {} {:.1f}% ({} / {} bytes)",
                                   d.value("model_id", ""), d.value("state", ""),
                                   d.value("progress", 0.0),
                                   d.value("downloaded_bytes", uint64_t{0}),
                                   d.value("total_bytes", uint64_t{0}));
    if (d.contains("download_path") && d["download_path"].is_string()) {
        line += " -> " + d["download_path"].get<std::string>();
    }
    if (d.contains("error") && d["error"].is_string()) {
        line += " [" + d["error"].get<std::string>() + "]";
    }
    std::println("{}", line);
}

void print_task(const json& t) {
    std::println("Task {}: {} ({:.0f}%)", t.value("id", ""), t.value("state", ""),
                 t.value("progress", 0.0) * 100.0);
    if (t.contains("error")) {
        std::println("  Error: {} ({})", t.value("error", ""), t.value("error_kind", ""));
    }
    if (t.contains("warnings")) {
        for (auto& w : t["warnings"]) std::println("  Warning: {}", w.get<std::string>());
    }
    if (!t.contains("result")) return;

    for (auto& seg : t["result"]["segments"]) {
        std::println("[{:8.2f}s - {:8.2f}s] {}", seg.value("start_sec", 0.0),
                     seg.value("end_sec", 0.0), seg.value("text", ""));
    }
    if (t.contains("processing_time")) {
        std::println("Processed in {:.1f}s", t["processing_time"].get<double>());
    }
}

// Reads stream events until a terminal state or an error.
int follow_stream(UnixSocketClient& client, const std::string& model_id) {
    auto first = request(client, {{"cmd", "download_progress"}, {"model_id", model_id}}, -1);
    if (!first) return 1;

    json event = *first;
    while (true) {
        if (report_error(event)) return 1;

        auto& d = event["download"];
        print_download(d);
        auto state = d.value("state", "");
        if (state == "completed") return 0;
        if (state == "failed") return 1;

        if (!client.recv(event, -1)) {
            std::println(stderr, "Connection to daemon lost");
            return 1;
        }
    }
}

int wait_for_task(UnixSocketClient& client, const std::string& id, const Args& a) {
    json task;
    while (true) {
        auto resp = request(client, {{"cmd", "task"}, {"task_id", id}});
        if (!resp) return 1;
        if (report_error(*resp)) return 1;

        task = (*resp)["task"];
        auto state = task.value("state", "");
        if (state == "completed" || state == "failed") break;
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    print_task(task);
    if (task.value("state", "") != "completed") return 1;

    if (!a.output_dir.empty()) {
        auto resp = request(client, {{"cmd", "export"}, {"task_id", id},
                                     {"output_dir", a.output_dir}, {"srt", a.srt}});
        if (!resp) return 1;
        if (report_error(*resp)) return 1;
        for (auto& f : (*resp)["files"]) std::println("Wrote {}", f.get<std::string>());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    auto parsed = parse_args(argc, argv);
    if (!parsed) return 1;
    const Args& a = *parsed;

    auto need_positional = [&](const char* what) {
        if (a.positional.empty()) {
            std::println(stderr, "{} requires {}", a.command, what);
            usage(argv[0]);
            return false;
        }
        return true;
    };

    // Build command JSON
    json cmd;
    int timeout_ms = kDefaultTimeoutMs;
    if (a.command == "health") {
        cmd = {{"cmd", "health"}};
    } else if (a.command == "init") {
        if (!need_positional("a model id")) return 1;
        cmd = {{"cmd", "initialize"}, {"model", a.positional[0]}, {"options", json::object()}};
        if (!a.device.empty()) cmd["device"] = a.device;
        if (a.vad_model) cmd["options"]["vad_model"] = *a.vad_model;
        if (a.punc_model) cmd["options"]["punc_model"] = *a.punc_model;
        if (a.spk_model) cmd["options"]["spk_model"] = *a.spk_model;
        if (a.max_segment_ms) cmd["options"]["max_single_segment_time"] = *a.max_segment_ms;
        timeout_ms = kInitializeTimeoutMs;
    } else if (a.command == "transcribe") {
        if (!need_positional("an audio path")) return 1;
        json opts = {
            {"spk_enable", a.speaker},
            {"word_timestamp", a.word_timestamp},
            {"return_stamp", !a.no_return_stamp},
            {"merge_vad", a.merge_vad},
        };
        if (a.batch_size_s) opts["batch_size_s"] = *a.batch_size_s;
        if (a.batch_threshold_s) opts["batch_size_threshold_s"] = *a.batch_threshold_s;
        if (a.merge_length_s) opts["merge_length_s"] = *a.merge_length_s;
        cmd = {{"cmd", "transcribe"}, {"audio_path", a.positional[0]}, {"options", opts}};
    } else if (a.command == "task") {
        if (!need_positional("a task id")) return 1;
        cmd = {{"cmd", "task"}, {"task_id", a.positional[0]}};
    } else if (a.command == "download") {
        if (!need_positional("a model id")) return 1;
        cmd = {{"cmd", "download"}, {"model_id", a.positional[0]}};
        if (!a.cache_dir.empty()) cmd["cache_dir"] = a.cache_dir;
    } else if (a.command == "download-status") {
        if (!need_positional("a model id")) return 1;
        cmd = {{"cmd", "download_status"}, {"model_id", a.positional[0]}};
    } else if (a.command == "download-progress") {
        if (!need_positional("a model id")) return 1;
    } else if (a.command == "cancel-download") {
        if (!need_positional("a model id")) return 1;
        cmd = {{"cmd", "cancel_download"}, {"model_id", a.positional[0]}};
    } else if (a.command == "history") {
        cmd = {{"cmd", "history"}, {"limit", a.limit}};
    } else {
        std::println(stderr, "Unknown command: {}", a.command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is longscribed running?");
        return 1;
    }

    if (a.command == "download-progress") {
        return follow_stream(client, a.positional[0]);
    }

    auto response = request(client, cmd, timeout_ms);
    if (!response) return 1;
    if (report_error(*response)) return 1;

    // Display response
    if (a.command == "health") {
        auto model = (*response)["model"];
        std::println("State: {}", response->value("state", "unknown"));
        std::println("Model: {}", model.is_string() ? model.get<std::string>() : "(none)");
        std::println("Tasks: {} ({} active)", response->value("task_count", 0),
                     response->value("active_tasks", 0));
    } else if (a.command == "init") {
        std::println("Model {} ready", a.positional[0]);
    } else if (a.command == "transcribe") {
        auto id = response->value("task_id", "");
        std::println("{}", id);
        if (a.wait) return wait_for_task(client, id, a);
    } else if (a.command == "task") {
        print_task((*response)["task"]);
    } else if (a.command == "download") {
        std::println("{}", response->value("message", "Download started"));
        if (a.follow) return follow_stream(client, a.positional[0]);
    } else if (a.command == "download-status") {
        print_download((*response)["download"]);
    } else if (a.command == "history") {
        if (response->contains("entries")) {
            for (auto& entry : (*response)["entries"]) {
                std::println("[{}] {} {} ({})", entry.value("timestamp", ""),
                             entry.value("task_id", ""), entry.value("state", ""),
                             entry.value("audio_path", ""));
                auto text = entry.value("text", "");
                if (!text.empty()) std::println("  {}", text);
                if (entry.contains("error")) {
                    std::println("  Error: {}", entry["error"].get<std::string>());
                }
            }
        }
    } else {
        std::println("{}", response->value("message", "OK"));
    }

    return 0;
}
