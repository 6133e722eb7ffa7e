#include "daemon_core.hpp"

#include "output/transcript_writer.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

std::string cache_dir_for(const Config& cfg) {
    return cfg.download.cache_dir.empty() ? platform::model_cache_dir() : cfg.download.cache_dir;
}

// Missing or non-string fields read as empty.
std::string string_field(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Error missing_field(const char* key) {
    return Error{.kind = ErrorKind::InvalidRequest, .message = std::string(key) + " is required"};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       ModelLoader& loader, ModelFetcher& fetcher, IpcServer& ipc,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), notify_(std::move(notify)),
      handles_(loader),
      downloads_(fetcher, cache_dir_for(config_)),
      tasks_(handles_, [this](const Task& t) { on_task_update(t); }) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    if (config_.history.enabled) {
        std::string db_path = config_.history.path;
        if (db_path.empty()) {
            auto data = platform::data_dir();
            db_path = data.empty() ? "/tmp/longscribe/history.db" : data + "/history.db";
        }
        history_open_ = history_db_.open(db_path);
        if (!history_open_) {
            std::println(stderr, "db: history DB failed to open, history disabled");
        } else {
            log("History at " + db_path);
        }
    }

    if (!config_.model.default_model.empty()) {
        auto spec = model_spec(json{{"model", config_.model.default_model}});
        bool started = background_.spawn([this, spec] {
            log("Loading default model " + spec.model);
            auto res = handles_.initialize(spec);
            if (!res) {
                std::println(stderr, "runtime: default model {} failed to load: {}",
                             spec.model, res.error().message);
            }
        });
        if (!started) {
            std::println(stderr, "runtime: could not start loading default model {}", spec.model);
        }
    }

    return true;
}

json DaemonCore::handle_request(int client_fd, const json& request) {
    auto cmd_str = string_field(request, "cmd");
    if (cmd_str.empty()) {
        return error_response({.kind = ErrorKind::InvalidRequest,
                               .message = "cmd must be a non-empty string"});
    }
    log("Command: " + cmd_str);

    try {
        if (cmd_str == "initialize") return start_initialize(client_fd, request);
        return handle_command(cmd_str, request);
    } catch (const json::exception& e) {
        return error_response({.kind = ErrorKind::InvalidRequest,
                               .message = std::string("bad request field: ") + e.what()});
    }
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "initialize") return handle_initialize(cmd);
    if (cmd_str == "transcribe") return handle_transcribe(cmd);
    if (cmd_str == "task") return handle_task(cmd);
    if (cmd_str == "download") return handle_download(cmd);
    if (cmd_str == "download_status") return handle_download_status(cmd);
    if (cmd_str == "download_progress") return handle_download_progress(cmd);
    if (cmd_str == "cancel_download") return handle_cancel_download(cmd);
    if (cmd_str == "health") return handle_health(cmd);
    if (cmd_str == "export") return handle_export(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    return error_response({.kind = ErrorKind::InvalidRequest,
                           .message = "unknown command: " + cmd_str});
}

json DaemonCore::error_response(const Error& err) {
    json resp = {
        {"status", "error"},
        {"kind", std::string(to_string(err.kind))},
        {"message", err.message},
    };
    if (!err.option.empty()) resp["option"] = err.option;
    return resp;
}

ModelSpec DaemonCore::model_spec(const json& cmd) const {
    ModelSpec spec{
        .model = string_field(cmd, "model"),
        .device = cmd.contains("device") ? string_field(cmd, "device") : config_.model.device,
    };

    if (auto it = cmd.find("options"); it != cmd.end() && it->is_object()) {
        spec.options = *it;
    }

    // An explicit empty string disables the component.
    auto& opts = spec.options;
    if (!opts.contains("vad_model")) opts["vad_model"] = config_.model.vad_model;
    if (!opts.contains("punc_model")) opts["punc_model"] = config_.model.punc_model;
    if (!opts.contains("spk_model")) opts["spk_model"] = config_.model.spk_model;
    if (!opts.contains("max_single_segment_time")) {
        opts["max_single_segment_time"] = config_.model.max_single_segment_time;
    }
    return spec;
}

json DaemonCore::handle_initialize(const json& cmd) {
    auto spec = model_spec(cmd);
    if (spec.model.empty()) return error_response(missing_field("model"));
    return run_initialize(spec);
}

json DaemonCore::start_initialize(int client_fd, const json& cmd) {
    auto spec = model_spec(cmd);
    if (spec.model.empty()) return error_response(missing_field("model"));

    auto request_id = next_request_id_++;
    waiting_clients_[request_id] = client_fd;

    bool started = background_.spawn([this, request_id, spec] {
        auto response = run_initialize(spec);
        {
            std::lock_guard lock(completed_mutex_);
            replies_.push_back({.request_id = request_id, .response = std::move(response)});
        }
        if (notify_) notify_();
    });
    if (!started) {
        waiting_clients_.erase(request_id);
        return error_response({.kind = ErrorKind::TransientIO,
                               .message = "no worker available to load " + spec.model});
    }

    log("Loading " + spec.model + " for client " + std::to_string(client_fd));
    return {{"status", "deferred"}};
}

json DaemonCore::run_initialize(const ModelSpec& spec) {
    auto start = std::chrono::steady_clock::now();
    auto res = handles_.initialize(spec);
    if (!res) return error_response(res.error());

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log(std::format("Model {} initialized in {:.1f}s", spec.model, elapsed));
    return {
        {"status", "ok"},
        {"state", "ready"},
        {"loaded_models", json::array({spec.model})},
    };
}

json DaemonCore::handle_transcribe(const json& cmd) {
    auto audio_path = string_field(cmd, "audio_path");
    if (audio_path.empty()) return error_response(missing_field("audio_path"));

    json options = json::object();
    if (auto it = cmd.find("options"); it != cmd.end() && it->is_object()) options = *it;

    auto id = tasks_.submit(audio_path, std::move(options));
    if (!id) return error_response(id.error());

    return {{"status", "ok"}, {"task_id", *id}, {"state", "queued"}};
}

json DaemonCore::handle_task(const json& cmd) {
    auto id = string_field(cmd, "task_id");
    if (id.empty()) return error_response(missing_field("task_id"));

    auto task = tasks_.get(id);
    if (!task) return error_response(task.error());
    return {{"status", "ok"}, {"task", *task}};
}

json DaemonCore::handle_download(const json& cmd) {
    auto model_id = string_field(cmd, "model_id");
    if (model_id.empty()) return error_response(missing_field("model_id"));

    auto res = downloads_.submit(model_id, string_field(cmd, "cache_dir"));
    if (!res) return error_response(res.error());

    return {
        {"status", "ok"},
        {"model_id", model_id},
        {"state", "downloading"},
        {"message", "Download started for model " + model_id},
    };
}

json DaemonCore::handle_download_status(const json& cmd) {
    auto model_id = string_field(cmd, "model_id");
    if (model_id.empty()) return error_response(missing_field("model_id"));
    return {{"status", "ok"}, {"download", downloads_.status(model_id)}};
}

json DaemonCore::handle_download_progress(const json& cmd) {
    auto model_id = string_field(cmd, "model_id");
    if (model_id.empty()) return error_response(missing_field("model_id"));
    return {{"status", "streaming"}, {"model_id", model_id}};
}

json DaemonCore::handle_cancel_download(const json& cmd) {
    auto model_id = string_field(cmd, "model_id");
    if (model_id.empty()) return error_response(missing_field("model_id"));

    auto res = downloads_.cancel(model_id);
    if (!res) return error_response(res.error());
    return {{"status", "ok"}, {"message", "Cancellation requested for model " + model_id}};
}

json DaemonCore::handle_health(const json& /*cmd*/) {
    auto model = handles_.current_model();
    return {
        {"status", "ok"},
        {"state", "ok"},
        {"model", model ? json(*model) : json(nullptr)},
        {"task_count", tasks_.task_count()},
        {"active_tasks", tasks_.active_count()},
    };
}

json DaemonCore::handle_export(const json& cmd) {
    auto id = string_field(cmd, "task_id");
    if (id.empty()) return error_response(missing_field("task_id"));
    auto output_dir = string_field(cmd, "output_dir");
    if (output_dir.empty()) return error_response(missing_field("output_dir"));

    auto task = tasks_.get(id);
    if (!task) return error_response(task.error());
    if (task->state != TaskState::Completed) {
        return error_response({.kind = ErrorKind::InvalidRequest,
                               .message = std::format("task {} is {}, not completed",
                                                      id, to_string(task->state))});
    }

    bool with_srt = cmd.contains("srt") && cmd["srt"].is_boolean() && cmd["srt"].get<bool>();
    auto files = transcript::write_artifacts(task->segments, output_dir, with_srt);
    if (!files) return error_response(files.error());

    log(std::format("Exported task {} to {}", id, output_dir));
    return {{"status", "ok"}, {"files", *files}};
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end() && it->is_number_integer()) {
        limit = it->get<int>();
    }
    if (limit <= 0) {
        return error_response({.kind = ErrorKind::InvalidRequest,
                               .message = "limit must be positive"});
    }

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    if (!history_open_) return resp;
    for (auto& e : history_db_.recent(limit)) {
        resp["entries"].push_back(e);
    }
    return resp;
}

void DaemonCore::add_stream(int fd, const std::string& model_id) {
    DownloadStatusStream stream(downloads_, model_id,
                                std::chrono::milliseconds(config_.download.stream_interval_ms));

    if (auto event = stream.poll()) {
        if (!ipc_.send_response(fd, *event)) return;
    }
    if (stream.finished()) return;

    log("Streaming download progress for " + model_id);
    streams_.push_back(StreamClient{.fd = fd, .stream = std::move(stream)});
}

void DaemonCore::tick_streams() {
    for (auto it = streams_.begin(); it != streams_.end();) {
        bool keep = true;
        if (auto event = it->stream.poll()) {
            keep = ipc_.send_response(it->fd, *event);
        }
        if (!keep || it->stream.finished()) {
            it = streams_.erase(it);
        } else {
            ++it;
        }
    }
}

void DaemonCore::remove_client(int fd) {
    std::erase_if(streams_, [fd](const StreamClient& s) { return s.fd == fd; });
    std::erase_if(waiting_clients_, [fd](const auto& entry) { return entry.second == fd; });
}

void DaemonCore::on_task_update(const Task& task) {
    if (!task.terminal()) {
        log(std::format("Task {} {}", task.id, to_string(task.state)));
        return;
    }
    {
        std::lock_guard lock(completed_mutex_);
        completed_.push_back(task);
    }
    if (notify_) notify_();
}

void DaemonCore::on_worker_event() {
    std::vector<Task> done;
    std::vector<DeferredReply> replies;
    {
        std::lock_guard lock(completed_mutex_);
        done.swap(completed_);
        replies.swap(replies_);
    }

    for (auto& reply : replies) {
        auto it = waiting_clients_.find(reply.request_id);
        // The client disconnected while waiting
        if (it == waiting_clients_.end()) continue;
        if (!ipc_.send_response(it->second, reply.response)) {
            std::println(stderr, "ipc: could not deliver reply to client {}", it->second);
        }
        waiting_clients_.erase(it);
    }

    for (const auto& task : done) {
        if (task.state == TaskState::Completed) {
            log(std::format("Task {} completed: {} segments, {:.1f}s",
                            task.id, task.segments.size(), task.processing_time));
        } else {
            log(std::format("Task {} failed: {}", task.id, task.error.value_or("unknown error")));
        }
        if (history_open_ && !history_db_.insert(task)) {
            std::println(stderr, "db: could not record task {}", task.id);
        }
    }
}

void DaemonCore::shutdown() {
    if (background_.size() > 0) {
        log("Waiting for model initialization to finish...");
    }
    background_.join_all();
    downloads_.shutdown();
    tasks_.shutdown();
    streams_.clear();
    on_worker_event();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
