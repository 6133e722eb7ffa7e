#include "runtime/model_handles.hpp"

#include <print>

using json = nlohmann::json;

namespace {

std::string string_option(const json& options, const char* key) {
    auto it = options.find(key);
    if (it == options.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool bool_option(const json& options, const char* key, bool fallback) {
    auto it = options.find(key);
    if (it == options.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

} // namespace

json build_load_options(const ModelSpec& spec) {
    json kwargs = {{"model", spec.model}, {"disable_update", true}};
    const json& opts = spec.options.is_object() ? spec.options : json::object();

    auto vad_model = string_option(opts, "vad_model");
    if (!vad_model.empty()) {
        kwargs["vad_model"] = vad_model;

        json vad_kwargs = json::object();
        if (auto it = opts.find("vad_kwargs"); it != opts.end() && it->is_object()) {
            vad_kwargs = *it;
        }
        if (opts.contains("max_single_segment_time") && !vad_kwargs.contains("max_single_segment_time")) {
            vad_kwargs["max_single_segment_time"] = opts["max_single_segment_time"];
        }
        if (!vad_kwargs.empty()) kwargs["vad_kwargs"] = std::move(vad_kwargs);
    }

    auto punc_model = string_option(opts, "punc_model");
    if (!punc_model.empty()) kwargs["punc_model"] = punc_model;

    auto spk_model = string_option(opts, "spk_model");
    if (!spk_model.empty()) kwargs["spk_model"] = spk_model;

    if (!spec.device.empty()) kwargs["device"] = spec.device;

    if (bool_option(opts, "sentence_timestamp", true)) kwargs["sentence_timestamp"] = true;

    return kwargs;
}

ModelHandles::ModelHandles(ModelLoader& loader) : loader_(loader) {}

Result<void> ModelHandles::initialize(const ModelSpec& spec) {
    if (spec.model.empty()) {
        return make_error(ErrorKind::InvalidRequest, "model identifier is required");
    }

    std::lock_guard load_lock(load_mutex_);

    auto full_options = build_load_options(spec);
    std::println(stderr, "runtime: loading {} with {}", spec.model, full_options.dump());
    auto with_speaker = loader_.load(full_options);
    if (!with_speaker) {
        return make_error(ErrorKind::Configuration,
                          "failed to load " + spec.model + ": " + with_speaker.error().message);
    }

    ModelSpec stripped = spec;
    if (stripped.options.is_object()) stripped.options.erase("spk_model");
    auto without_speaker = loader_.load(build_load_options(stripped));
    if (!without_speaker) {
        return make_error(ErrorKind::Configuration,
                          "failed to load " + spec.model + " (without speaker): " +
                          without_speaker.error().message);
    }

    {
        std::lock_guard lock(mutex_);
        pair_ = HandlePair{
            .model_id = spec.model,
            .with_speaker = std::move(*with_speaker),
            .without_speaker = std::move(*without_speaker),
        };
    }
    std::println(stderr, "runtime: {} ready", spec.model);
    return {};
}

Result<std::shared_ptr<ModelRuntime>> ModelHandles::ensure_loaded(bool without_speaker) const {
    std::lock_guard lock(mutex_);

    if (without_speaker) {
        if (!pair_ || !pair_->without_speaker) {
            return make_error(ErrorKind::NotInitialized, "model (without speaker) is not initialized");
        }
        return pair_->without_speaker;
    }

    if (!pair_ || !pair_->with_speaker) {
        return make_error(ErrorKind::NotInitialized, "model is not initialized");
    }
    return pair_->with_speaker;
}

std::optional<std::string> ModelHandles::current_model() const {
    std::lock_guard lock(mutex_);
    if (!pair_) return std::nullopt;
    return pair_->model_id;
}
