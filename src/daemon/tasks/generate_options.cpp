#include "tasks/generate_options.hpp"

using json = nlohmann::json;

namespace {

// Truthiness of an optional request flag: booleans as-is, numbers non-zero.
bool flag(const json& opts, const char* key, bool fallback) {
    auto it = opts.find(key);
    if (it == opts.end() || it->is_null()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return fallback;
}

void copy_number(const json& from, json& to, const char* key) {
    auto it = from.find(key);
    if (it != from.end() && it->is_number()) to[key] = *it;
}

} // namespace

json build_generate_options(const json& request_options) {
    json kwargs = json::object();
    if (!request_options.is_object()) {
        kwargs["sentence_timestamp"] = true;
        kwargs["return_stamp"] = true;
        return kwargs;
    }

    const auto& opts = request_options;
    copy_number(opts, kwargs, "batch_size_s");
    copy_number(opts, kwargs, "batch_size_threshold_s");
    if (flag(opts, "sentence_timestamp", true)) kwargs["sentence_timestamp"] = true;
    if (flag(opts, "word_timestamp", false)) kwargs["word_timestamp"] = true;
    if (flag(opts, "return_stamp", true)) kwargs["return_stamp"] = true;
    if (flag(opts, "merge_vad", false)) kwargs["merge_vad"] = true;
    copy_number(opts, kwargs, "merge_length_s");
    return kwargs;
}

bool speaker_requested(const json& request_options) {
    if (!request_options.is_object()) return false;
    auto it = request_options.find("spk_enable");
    return it != request_options.end() && it->is_boolean() && it->get<bool>();
}
