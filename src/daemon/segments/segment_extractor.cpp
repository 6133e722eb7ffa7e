#include "segments/segment_extractor.hpp"

#include "segments/sentence_splitter.hpp"

#include <charconv>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace segments {

namespace {

std::optional<double> as_number(const json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) {
        const auto& s = j.get_ref<const std::string&>();
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc() && ptr == s.data() + s.size()) return v;
    }
    return std::nullopt;
}

std::optional<double> number_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    return as_number(*it);
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Field value with JSON-in-a-string unwrapped. Null when absent or malformed.
json decoded_field(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) return nullptr;
    if (!it->is_string()) return *it;

    auto parsed = json::parse(it->get_ref<const std::string&>(), nullptr, false);
    if (parsed.is_discarded()) return nullptr;
    return parsed;
}

std::vector<Segment> from_sentence_info(const json& record) {
    std::vector<Segment> out;
    auto it = record.find("sentence_info");
    if (it == record.end() || !it->is_array()) return out;

    for (const auto& sent : *it) {
        if (!sent.is_object()) continue;
        auto text_it = sent.find("text");
        if (text_it == sent.end() || !text_it->is_string()) continue;

        auto start = number_field(sent, "start");
        auto end = number_field(sent, "end");
        auto text = trim(text_it->get_ref<const std::string&>());
        if (text.empty() || !start || !end) continue;

        out.push_back({.text = std::move(text), .start_sec = *start, .end_sec = *end});
    }
    return out;
}

std::vector<Segment> from_stamp_sents(const json& record) {
    std::vector<Segment> out;
    auto stamp_sents = decoded_field(record, "stamp_sents");
    if (!stamp_sents.is_array()) return out;

    for (const auto& sent : stamp_sents) {
        if (!sent.is_object()) continue;
        auto start = number_field(sent, "start");
        auto end = number_field(sent, "end");
        if (!start || !end) continue;

        auto text = trim(string_field(sent, "text_seg") + string_field(sent, "punc"));
        if (text.empty()) continue;

        out.push_back({.text = std::move(text),
                       .start_sec = *start / 1000.0,
                       .end_sec = *end / 1000.0});
    }
    return out;
}

std::vector<WordStamp> word_stamps(const json& record) {
    std::vector<WordStamp> stamps;
    auto timestamp = decoded_field(record, "timestamp");
    if (!timestamp.is_array()) return stamps;

    for (const auto& pair : timestamp) {
        if (!pair.is_array() || pair.empty()) continue;
        auto start = as_number(pair.front());
        auto end = as_number(pair.back());
        if (!start || !end) continue;
        stamps.push_back({.start_ms = *start, .end_ms = *end});
    }
    return stamps;
}

std::vector<Segment> from_text(const json& record) {
    std::vector<Segment> out;
    auto text = trim(string_field(record, "text"));
    if (text.empty()) return out;

    auto stamps = word_stamps(record);
    if (stamps.empty()) {
        out.push_back({.text = std::move(text), .start_sec = 0.0, .end_sec = 0.0});
        return out;
    }

    auto sentences = split_sentences(text);
    if (sentences.size() > 1) {
        return map_sentences_to_timestamps(sentences, stamps, text);
    }

    out.push_back({.text = std::move(text),
                   .start_sec = stamps.front().start_ms / 1000.0,
                   .end_sec = stamps.back().end_ms / 1000.0});
    return out;
}

} // namespace

std::vector<Segment> extract(const json& record) {
    if (!record.is_object()) return {};

    auto out = from_sentence_info(record);
    if (!out.empty()) return out;

    out = from_stamp_sents(record);
    if (!out.empty()) return out;

    return from_text(record);
}

bool has_sentence_timing(const json& record) {
    if (!record.is_object()) return false;
    auto non_empty = [&record](const char* key) {
        auto it = record.find(key);
        if (it == record.end() || it->is_null()) return false;
        if (it->is_string()) return !it->get_ref<const std::string&>().empty();
        return !it->empty();
    };
    return non_empty("sentence_info") || non_empty("stamp_sents");
}

} // namespace segments
