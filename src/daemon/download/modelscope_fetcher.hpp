#pragma once

#include "download/model_fetcher.hpp"
#include "net/http_client.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Snapshot download from a ModelScope hub: lists the repository files, then
// fetches each blob into {cache_dir}/{model_id}/. Files already present
// with the expected size are skipped.
class ModelScopeFetcher : public ModelFetcher {
public:
    struct RepoFile {
        std::string path;
        uint64_t size = 0;
    };

    ModelScopeFetcher(std::string hub_url, std::string revision, http::Options opts);
    ~ModelScopeFetcher() override;

    Result<std::string> fetch(const std::string& model_id, const std::string& cache_dir,
                              const ProgressFactory& open_file) override;

    // Parses the hub's file listing response; directories are skipped.
    static Result<std::vector<RepoFile>> parse_file_list(const nlohmann::json& resp);

private:
    std::string files_url(const std::string& model_id) const;
    std::string file_url(const std::string& model_id, const std::string& path) const;

    http::GlobalInit curl_;
    std::string hub_url_;
    std::string revision_;
    http::Options opts_;
};
