#pragma once

#include "errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

// Byte-count sink for one file of a model snapshot.
class FileProgress {
public:
    virtual ~FileProgress() = default;
    // Bytes received since the previous call. False means abort the fetch.
    // Fetchers also call update(0) while a transfer is idle, so an abort is
    // seen on a stalled connection.
    virtual bool update(uint64_t bytes) = 0;
    virtual void end() = 0;
};

// Opens a tracker for each file as the fetcher starts on it. file_size is 0
// when unknown.
using ProgressFactory =
    std::function<std::unique_ptr<FileProgress>(const std::string& file_name, uint64_t file_size)>;

// Fetches every file of a model into cache_dir and returns the local model
// directory. An abort requested through FileProgress::update must surface
// as ErrorKind::DownloadCancelled.
class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;
    virtual Result<std::string> fetch(const std::string& model_id, const std::string& cache_dir,
                                      const ProgressFactory& open_file) = 0;
};

// True for a non-empty relative path that stays inside the directory it is
// joined to: no root, no ".." escaping it. Model ids and hub file paths are
// checked with this before they touch the cache.
inline bool is_contained_path(const std::string& path) {
    if (path.empty()) return false;
    auto normal = std::filesystem::path(path).lexically_normal();
    if (normal.has_root_path() || normal.empty() || normal == ".") return false;
    return *normal.begin() != "..";
}
