#pragma once

#include "net/http_client.hpp"
#include "runtime/model_runtime.hpp"

#include <string>

// Talks to a model-runtime server over HTTP.
//   POST {url}/load      {load options}                  -> {"handle": "..."}
//   POST {url}/generate  {"handle", "input", "kwargs"}   -> {"results": [...]}
// Errors come back as {"error": "...", "unsupported_option": "..."?}.
class RemoteModelLoader : public ModelLoader {
public:
    RemoteModelLoader(std::string url, http::Options opts);
    ~RemoteModelLoader() override;

    Result<std::shared_ptr<ModelRuntime>> load(const nlohmann::json& load_options) override;

private:
    http::GlobalInit curl_;
    std::string url_;
    http::Options opts_;
};

class RemoteModelRuntime : public ModelRuntime {
public:
    RemoteModelRuntime(std::string url, std::string handle, http::Options opts);

    Result<std::vector<nlohmann::json>>
        generate(const std::string& audio_path, const nlohmann::json& options) override;

    const std::string& handle() const { return handle_; }

private:
    std::string url_;
    std::string handle_;
    http::Options opts_;
};
