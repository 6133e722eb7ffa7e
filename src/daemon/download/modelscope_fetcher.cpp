#include "download/modelscope_fetcher.hpp"

#include <filesystem>
#include <print>

using json = nlohmann::json;
namespace fs = std::filesystem;

ModelScopeFetcher::ModelScopeFetcher(std::string hub_url, std::string revision, http::Options opts)
    : hub_url_(std::move(hub_url)), revision_(std::move(revision)), opts_(opts) {}

ModelScopeFetcher::~ModelScopeFetcher() = default;

Result<std::vector<ModelScopeFetcher::RepoFile>>
ModelScopeFetcher::parse_file_list(const json& resp) {
    auto data = resp.find("Data");
    if (data == resp.end() || !data->is_object()) {
        std::string msg = resp.is_object() ? resp.value("Message", "") : "";
        return make_error(ErrorKind::TransientIO,
                          msg.empty() ? "unexpected file listing: " + resp.dump() : msg);
    }

    auto files = data->find("Files");
    if (files == data->end() || !files->is_array()) {
        return make_error(ErrorKind::TransientIO, "file listing has no Files array");
    }

    std::vector<RepoFile> out;
    for (const auto& f : *files) {
        if (!f.is_object()) continue;
        if (f.value("Type", "blob") == "tree") continue;

        auto path_it = f.find("Path");
        if (path_it == f.end() || !path_it->is_string()) continue;
        auto path = path_it->get<std::string>();
        if (path.empty()) continue;
        if (!is_contained_path(path)) {
            return make_error(ErrorKind::TransientIO, "unsafe path in file listing: " + path);
        }

        uint64_t size = 0;
        if (auto it = f.find("Size"); it != f.end() && it->is_number_integer() &&
                                       it->get<int64_t>() > 0) {
            size = it->get<uint64_t>();
        }
        out.push_back({.path = std::move(path), .size = size});
    }
    return out;
}

Result<std::string> ModelScopeFetcher::fetch(const std::string& model_id, const std::string& cache_dir,
                                             const ProgressFactory& open_file) {
    if (!is_contained_path(model_id)) {
        return make_error(ErrorKind::InvalidRequest, "invalid model_id: " + model_id);
    }

    auto listing = http::get_json(files_url(model_id), opts_);
    if (!listing) return std::unexpected(listing.error());

    auto files = parse_file_list(*listing);
    if (!files) return std::unexpected(files.error());

    auto model_dir = fs::path(cache_dir) / model_id;

    for (const auto& file : *files) {
        auto dest = model_dir / file.path;

        std::error_code ec;
        if (file.size > 0 && fs::exists(dest, ec) && fs::file_size(dest, ec) == file.size) {
            std::println(stderr, "downloads: [{}] {} already cached", model_id, file.path);
            continue;
        }

        auto progress = open_file(file.path, file.size);
        auto res = http::download_file(
            file_url(model_id, file.path), dest,
            [&progress](uint64_t n) { return progress->update(n); }, opts_);
        if (!res) return std::unexpected(res.error());
        progress->end();
    }

    return model_dir.string();
}

std::string ModelScopeFetcher::files_url(const std::string& model_id) const {
    return hub_url_ + "/api/v1/models/" + model_id + "/repo/files?Revision=" +
           http::escape(revision_) + "&Recursive=true";
}

std::string ModelScopeFetcher::file_url(const std::string& model_id, const std::string& path) const {
    return hub_url_ + "/api/v1/models/" + model_id + "/repo?Revision=" +
           http::escape(revision_) + "&FilePath=" + http::escape(path);
}
