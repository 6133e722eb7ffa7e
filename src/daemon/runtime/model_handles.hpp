#pragma once

#include "errors.hpp"
#include "runtime/model_runtime.hpp"

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ModelSpec {
    std::string model;
    std::string device;
    // vad_model, vad_kwargs, max_single_segment_time, punc_model, spk_model,
    // sentence_timestamp
    nlohmann::json options = nlohmann::json::object();
};

// Load options for the runtime, in the shape the runtime expects.
nlohmann::json build_load_options(const ModelSpec& spec);

// Owns the speaker-aware / speaker-free handle pair for one model.
// load_mutex_ serializes initializations for the whole of both loads;
// mutex_ guards only the pair itself, so lookups never wait on a load.
// Recognition runs outside both locks on a shared_ptr copy, so a handle
// outlives a concurrent re-initialization.
class ModelHandles {
public:
    explicit ModelHandles(ModelLoader& loader);

    ModelHandles(const ModelHandles&) = delete;
    ModelHandles& operator=(const ModelHandles&) = delete;

    // Loads both variants under the load lock and replaces the pair only
    // when both loads succeed. Failures are ConfigurationError.
    Result<void> initialize(const ModelSpec& spec);

    Result<std::shared_ptr<ModelRuntime>> ensure_loaded(bool without_speaker) const;

    std::optional<std::string> current_model() const;

private:
    struct HandlePair {
        std::string model_id;
        std::shared_ptr<ModelRuntime> with_speaker;
        std::shared_ptr<ModelRuntime> without_speaker;
    };

    ModelLoader& loader_;
    std::mutex load_mutex_;
    mutable std::mutex mutex_;
    std::optional<HandlePair> pair_;
};
