#include "runtime/remote_runtime.hpp"

#include <chrono>
#include <print>

using json = nlohmann::json;

namespace {

std::string error_message(const json& j) {
    auto it = j.find("error");
    if (it == j.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

} // namespace

RemoteModelLoader::RemoteModelLoader(std::string url, http::Options opts)
    : url_(std::move(url)), opts_(opts) {}

RemoteModelLoader::~RemoteModelLoader() = default;

Result<std::shared_ptr<ModelRuntime>> RemoteModelLoader::load(const json& load_options) {
    auto resp = http::post_json(url_ + "/load", load_options, opts_);
    if (!resp) {
        return make_error(ErrorKind::Configuration, "runtime unreachable: " + resp.error().message);
    }

    if (auto msg = error_message(*resp); !msg.empty()) {
        return make_error(ErrorKind::Configuration, "runtime error: " + msg);
    }

    auto it = resp->find("handle");
    if (it == resp->end() || !it->is_string()) {
        return make_error(ErrorKind::Configuration, "unexpected response: " + resp->dump());
    }

    return std::make_shared<RemoteModelRuntime>(url_, it->get<std::string>(), opts_);
}

RemoteModelRuntime::RemoteModelRuntime(std::string url, std::string handle, http::Options opts)
    : url_(std::move(url)), handle_(std::move(handle)), opts_(opts) {}

Result<std::vector<json>>
RemoteModelRuntime::generate(const std::string& audio_path, const json& options) {
    json body = {{"handle", handle_}, {"input", audio_path}, {"kwargs", options}};

    auto start = std::chrono::steady_clock::now();
    auto resp = http::post_json(url_ + "/generate", body, opts_);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!resp) return std::unexpected(resp.error());

    if (auto msg = error_message(*resp); !msg.empty()) {
        if (auto opt = resp->find("unsupported_option"); opt != resp->end()) {
            Error err{.kind = ErrorKind::UnsupportedOption, .message = msg};
            if (opt->is_string()) err.option = opt->get<std::string>();
            return std::unexpected(std::move(err));
        }
        return make_error(ErrorKind::Configuration, "runtime error: " + msg);
    }

    auto it = resp->find("results");
    if (it == resp->end() || !it->is_array()) {
        return make_error(ErrorKind::Configuration, "unexpected response: " + resp->dump());
    }

    std::println(stderr, "runtime: generate on {} took {:.1f}s", audio_path, elapsed);
    return it->get<std::vector<json>>();
}
