#include "download/download_manager.hpp"

#include <algorithm>
#include <print>

namespace {

constexpr uint64_t kLogEveryBytes = 10ull * 1024 * 1024;

double mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

class DownloadManager::FileTracker : public FileProgress {
public:
    FileTracker(DownloadManager& mgr, std::string model_id, std::string file_name, uint64_t file_size)
        : mgr_(mgr), model_id_(std::move(model_id)),
          file_name_(std::move(file_name)), file_size_(file_size) {}

    bool update(uint64_t bytes) override {
        if (bytes == 0) return !mgr_.cancel_requested(model_id_);

        uint64_t total = 0;
        double progress = 0.0;
        if (!mgr_.add_bytes(model_id_, bytes, file_size_, total, progress)) {
            std::println(stderr, "downloads: [{}] cancelled during {}", model_id_, file_name_);
            return false;
        }

        downloaded_ += bytes;
        if (downloaded_ - last_logged_ >= kLogEveryBytes || downloaded_ == file_size_) {
            last_logged_ = downloaded_;
            std::println(stderr, "downloads: [{}] {} {:.1f}/{:.1f} MB | total {:.1f} MB ({:.1f}%)",
                         model_id_, file_name_, mib(downloaded_), mib(file_size_),
                         mib(total), progress);
        }
        return true;
    }

    void end() override {
        std::println(stderr, "downloads: [{}] finished {} ({:.2f} MB)",
                     model_id_, file_name_, mib(downloaded_));
    }

private:
    DownloadManager& mgr_;
    std::string model_id_;
    std::string file_name_;
    uint64_t file_size_;
    uint64_t downloaded_ = 0;
    uint64_t last_logged_ = 0;
};

DownloadManager::DownloadManager(ModelFetcher& fetcher, std::string default_cache_dir)
    : fetcher_(fetcher), default_cache_dir_(std::move(default_cache_dir)) {}

DownloadManager::~DownloadManager() {
    shutdown();
}

Result<void> DownloadManager::submit(const std::string& model_id, const std::string& cache_dir) {
    if (model_id.empty()) {
        return make_error(ErrorKind::InvalidRequest, "model_id is required");
    }
    if (!is_contained_path(model_id)) {
        return make_error(ErrorKind::InvalidRequest, "invalid model_id: " + model_id);
    }

    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return make_error(ErrorKind::NotInitialized, "download manager is shutting down");
        }
        auto it = entries_.find(model_id);
        if (it != entries_.end() && !it->second.state.terminal()) {
            return make_error(ErrorKind::AlreadyRunning,
                              "Model " + model_id + " is already being downloaded");
        }
        entries_[model_id] = Entry{.state = DownloadState{.model_id = model_id}};
    }

    auto dir = cache_dir.empty() ? default_cache_dir_ : cache_dir;
    if (!workers_.spawn([this, model_id, dir] { run(model_id, dir); })) {
        std::lock_guard lock(mutex_);
        auto& s = entries_[model_id].state;
        s.state = DownloadStatus::Failed;
        s.error = "no worker available";
        return make_error(ErrorKind::TransientIO, "no worker available for " + model_id);
    }

    std::println(stderr, "downloads: [{}] started, cache_dir {}", model_id, dir);
    return {};
}

Result<void> DownloadManager::cancel(const std::string& model_id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(model_id);
    if (it == entries_.end() || it->second.state.state != DownloadStatus::Downloading) {
        return make_error(ErrorKind::NotFound, "No active download found for model " + model_id);
    }
    it->second.cancel_requested = true;
    std::println(stderr, "downloads: [{}] cancel requested", model_id);
    return {};
}

DownloadState DownloadManager::status(const std::string& model_id) const {
    if (auto s = find(model_id)) return *s;
    return DownloadState{.model_id = model_id};
}

std::optional<DownloadState> DownloadManager::find(const std::string& model_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(model_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.state;
}

size_t DownloadManager::worker_count() {
    return workers_.size();
}

void DownloadManager::shutdown() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        for (auto& [id, entry] : entries_) {
            if (!entry.state.terminal()) entry.cancel_requested = true;
        }
    }
    workers_.join_all();
}

void DownloadManager::run(const std::string& model_id, const std::string& cache_dir) {
    {
        std::lock_guard lock(mutex_);
        auto& s = entries_[model_id].state;
        s.state = DownloadStatus::Downloading;
        s.progress = 0.0;
        s.downloaded_bytes = 0;
        s.total_bytes = 0;
    }

    auto open_file = [this, &model_id](const std::string& file_name, uint64_t file_size)
        -> std::unique_ptr<FileProgress> {
        std::println(stderr, "downloads: [{}] fetching {} ({:.2f} MB)",
                     model_id, file_name, mib(file_size));
        return std::make_unique<FileTracker>(*this, model_id, file_name, file_size);
    };

    Result<std::string> path = make_error(ErrorKind::TransientIO, "fetch did not run");
    try {
        path = fetcher_.fetch(model_id, cache_dir, open_file);
    } catch (const std::exception& e) {
        path = make_error(ErrorKind::TransientIO, e.what());
    }

    std::lock_guard lock(mutex_);
    auto& entry = entries_[model_id];
    auto& s = entry.state;

    if (path) {
        s.state = DownloadStatus::Completed;
        s.progress = 100.0;
        s.download_path = *path;
        std::println(stderr, "downloads: [{}] completed -> {}", model_id, *path);
        return;
    }

    s.state = DownloadStatus::Failed;
    if (entry.cancel_requested || path.error().kind == ErrorKind::DownloadCancelled) {
        s.error = kCancelledMessage;
    } else {
        s.error = path.error().message;
    }
    std::println(stderr, "downloads: [{}] failed: {}", model_id, *s.error);
}

bool DownloadManager::add_bytes(const std::string& model_id, uint64_t bytes, uint64_t file_size,
                                uint64_t& total_downloaded, double& progress) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(model_id);
    if (it == entries_.end() || it->second.cancel_requested) return false;

    auto& s = it->second.state;
    s.downloaded_bytes += bytes;
    if (file_size > 0) {
        s.total_bytes = std::max(s.total_bytes, s.downloaded_bytes);
    }
    s.progress = s.total_bytes > 0
        ? std::min(99.0, static_cast<double>(s.downloaded_bytes) * 100.0 /
                             static_cast<double>(s.total_bytes))
        : 50.0;

    total_downloaded = s.downloaded_bytes;
    progress = s.progress;
    return true;
}

bool DownloadManager::cancel_requested(const std::string& model_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(model_id);
    return it == entries_.end() || it->second.cancel_requested;
}
