#pragma once

#include "errors.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// A loaded, ready-to-invoke model. Returns one result record per input.
// A rejected invocation option is reported as ErrorKind::UnsupportedOption,
// with Error::option naming it when the runtime says which one.
class ModelRuntime {
public:
    virtual ~ModelRuntime() = default;
    virtual Result<std::vector<nlohmann::json>>
        generate(const std::string& audio_path, const nlohmann::json& options) = 0;
};

// Builds runtimes from load options (model, vad_model, punc_model, ...).
// Loading may take minutes.
class ModelLoader {
public:
    virtual ~ModelLoader() = default;
    virtual Result<std::shared_ptr<ModelRuntime>> load(const nlohmann::json& load_options) = 0;
};
