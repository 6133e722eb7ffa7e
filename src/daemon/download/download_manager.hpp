#pragma once

#include "download/download_state.hpp"
#include "download/model_fetcher.hpp"
#include "errors.hpp"
#include "worker_set.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Model weight downloads, one job per model id:
// pending -> downloading -> completed | failed.
//
// Progress aggregates the byte increments of every file in the job. The
// aggregate size is not known up front, so total_bytes tracks the running
// maximum of itself and downloaded_bytes; progress therefore saturates at 99
// until the job completes and snaps to 100.
class DownloadManager {
public:
    DownloadManager(ModelFetcher& fetcher, std::string default_cache_dir);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // AlreadyRunning while a job for model_id is pending or downloading.
    // InvalidRequest for ids that would leave the cache directory.
    Result<void> submit(const std::string& model_id, const std::string& cache_dir = {});

    // Only while downloading. Takes effect at the next byte-count callback.
    Result<void> cancel(const std::string& model_id);

    // Pending with zero counters for ids never submitted.
    DownloadState status(const std::string& model_id) const;
    std::optional<DownloadState> find(const std::string& model_id) const;

    // Worker threads still running. Finished ones are released here and on
    // every submit().
    size_t worker_count();

    // Cancels running jobs and joins the workers.
    void shutdown();

    static constexpr const char* kCancelledMessage = "Download cancelled by user";

private:
    class FileTracker;

    void run(const std::string& model_id, const std::string& cache_dir);

    // Returns false when the job has been cancelled.
    bool add_bytes(const std::string& model_id, uint64_t bytes, uint64_t file_size,
                   uint64_t& total_downloaded, double& progress);
    bool cancel_requested(const std::string& model_id) const;

    struct Entry {
        DownloadState state;
        bool cancel_requested = false;
    };

    ModelFetcher& fetcher_;
    std::string default_cache_dir_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    bool stopped_ = false;

    WorkerSet workers_;
};
