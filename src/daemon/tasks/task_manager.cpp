#include "tasks/task_manager.hpp"

#include "segments/segment_extractor.hpp"
#include "tasks/generate_options.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>
#include <random>

using json = nlohmann::json;

std::string generate_task_id() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> hex(0, 15);
    std::uniform_int_distribution<int> variant(8, 11);

    constexpr const char* digits = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            id.push_back('-');
        } else if (i == 14) {
            id.push_back('4');
        } else if (i == 19) {
            id.push_back(digits[variant(gen)]);
        } else {
            id.push_back(digits[hex(gen)]);
        }
    }
    return id;
}

TaskManager::TaskManager(ModelHandles& handles, UpdateCallback on_update)
    : handles_(handles), on_update_(std::move(on_update)) {}

TaskManager::~TaskManager() {
    shutdown();
}

Result<std::string> TaskManager::submit(const std::string& audio_path, json options) {
    if (audio_path.empty()) {
        return make_error(ErrorKind::InvalidRequest, "audio_path is required");
    }
    if (!options.is_object()) options = json::object();

    auto handle = handles_.ensure_loaded(!speaker_requested(options));
    if (!handle) return std::unexpected(handle.error());

    auto id = generate_task_id();
    Task queued{.id = id, .audio_path = audio_path};
    {
        std::lock_guard lock(mutex_);
        tasks_.emplace(id, queued);
    }
    if (on_update_) on_update_(queued);

    bool started = workers_.spawn([this, id, audio_path, options = std::move(options)] {
        run(id, audio_path, options);
    });
    if (!started) {
        std::lock_guard lock(mutex_);
        tasks_.erase(id);
        return make_error(ErrorKind::TransientIO, "no worker available for task " + id);
    }

    std::println(stderr, "tasks: {} queued for {}", id, audio_path);
    return id;
}

Result<Task> TaskManager::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error(ErrorKind::NotFound, "task not found: " + id);
    }
    return it->second;
}

size_t TaskManager::task_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

size_t TaskManager::active_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::ranges::count_if(tasks_, [](const auto& kv) {
        return !kv.second.terminal();
    }));
}

size_t TaskManager::worker_count() {
    return workers_.size();
}

void TaskManager::shutdown() {
    workers_.join_all();
}

void TaskManager::run(const std::string& id, const std::string& audio_path, const json& options) {
    std::println(stderr, "tasks: {} processing {}", id, audio_path);
    set_processing(id);
    auto start = std::chrono::steady_clock::now();

    try {
        auto handle = handles_.ensure_loaded(!speaker_requested(options));
        if (!handle) {
            fail(id, handle.error());
            return;
        }

        auto results = invoke(**handle, id, audio_path, build_generate_options(options));
        if (!results) {
            fail(id, results.error());
            return;
        }
        if (results->empty()) {
            fail(id, Error{.kind = ErrorKind::EmptyResult,
                           .message = "model did not return any results for the provided audio"});
            return;
        }

        const json& record = results->front();
        auto segments = segments::extract(record);

        std::vector<std::string> warnings;
        if (segments.empty()) {
            warnings.push_back("no timed segments could be extracted from the model result");
        } else if (segments.size() == 1 && !segments::has_sentence_timing(record)) {
            warnings.push_back("only a single segment was produced; the model may not support "
                               "sentence-level timestamps");
        }

        std::string text;
        if (auto it = record.find("text"); it != record.end() && it->is_string()) {
            text = it->get<std::string>();
        }

        json metadata = {
            {"model", handles_.current_model().value_or("")},
            {"options", options},
            {"record_count", results->size()},
        };
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        size_t segment_count = segments.size();

        finish(id, [&](Task& t) {
            t.state = TaskState::Completed;
            t.progress = 1.0;
            t.segments = std::move(segments);
            t.raw = record;
            t.text = std::move(text);
            t.warnings = std::move(warnings);
            t.metadata = std::move(metadata);
            t.processing_time = elapsed;
        });
        std::println(stderr, "tasks: {} completed, {} segments in {:.1f}s", id, segment_count, elapsed);
    } catch (const std::exception& e) {
        fail(id, Error{.kind = ErrorKind::TransientIO, .message = e.what()});
    }
}

Result<std::vector<json>> TaskManager::invoke(ModelRuntime& runtime, const std::string& id,
                                              const std::string& audio_path,
                                              json generate_options) {
    auto results = runtime.generate(audio_path, generate_options);
    if (results || results.error().kind != ErrorKind::UnsupportedOption) return results;

    // Older runtimes reject return_stamp without naming it.
    auto option = results.error().option.empty() ? std::string("return_stamp")
                                                 : results.error().option;
    if (!generate_options.contains(option)) return results;

    std::println(stderr, "tasks: {} runtime rejected option '{}', retrying without it", id, option);
    generate_options.erase(option);
    return runtime.generate(audio_path, generate_options);
}

void TaskManager::set_processing(const std::string& id) {
    Task snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return;
        it->second.state = TaskState::Processing;
        it->second.progress = 0.05;
        snapshot = it->second;
    }
    if (on_update_) on_update_(snapshot);
}

void TaskManager::finish(const std::string& id, const std::function<void(Task&)>& apply) {
    Task snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return;
        apply(it->second);
        snapshot = it->second;
    }
    if (on_update_) on_update_(snapshot);
}

void TaskManager::fail(const std::string& id, const Error& err) {
    std::println(stderr, "tasks: {} failed ({}): {}", id, to_string(err.kind), err.message);
    finish(id, [&err](Task& t) {
        t.state = TaskState::Failed;
        t.progress = 1.0;
        t.error = err.message;
        t.error_kind = err.kind;
    });
}
