#pragma once

#include <nlohmann/json.hpp>

// Model invocation options from a transcribe request's options. Recognized:
// batch_size_s, batch_size_threshold_s, sentence_timestamp (default on),
// word_timestamp, return_stamp (default on), merge_vad, merge_length_s.
nlohmann::json build_generate_options(const nlohmann::json& request_options);

// spk_enable selects the speaker-aware handle; anything but true means the
// speaker-free one.
bool speaker_requested(const nlohmann::json& request_options);
