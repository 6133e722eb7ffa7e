#include "segments/sentence_splitter.hpp"

#include <algorithm>
#include <array>

namespace segments {

namespace {

// UTF-8 encodings of 。！？；
constexpr std::array<std::string_view, 4> kSentenceMarks = {
    "\xE3\x80\x82", "\xEF\xBC\x81", "\xEF\xBC\x9F", "\xEF\xBC\x9B",
};

size_t mark_length_at(std::string_view text, size_t pos) {
    for (auto mark : kSentenceMarks) {
        if (text.substr(pos, mark.size()) == mark) return mark.size();
    }
    return 0;
}

std::string_view strip_trailing_marks(std::string_view s) {
    bool stripped = true;
    while (stripped && !s.empty()) {
        stripped = false;
        for (auto mark : kSentenceMarks) {
            if (s.ends_with(mark)) {
                s.remove_suffix(mark.size());
                stripped = true;
                break;
            }
        }
    }
    return s;
}

constexpr std::string_view kAsciiSpaces = " \t\n\r\v\f\x1c\x1d\x1e\x1f";

// UTF-8 encodings of the non-ASCII Unicode white space: NEL, NBSP, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and the ideographic space.
constexpr std::array<std::string_view, 19> kUnicodeSpaces = {
    "\xC2\x85", "\xC2\xA0", "\xE1\x9A\x80",
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",
    "\xE2\x80\xA8", "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F",
    "\xE3\x80\x80",
};

size_t leading_space(std::string_view s) {
    if (s.empty()) return 0;
    if (kAsciiSpaces.find(s.front()) != std::string_view::npos) return 1;
    for (auto sp : kUnicodeSpaces) {
        if (s.starts_with(sp)) return sp.size();
    }
    return 0;
}

size_t trailing_space(std::string_view s) {
    if (s.empty()) return 0;
    if (kAsciiSpaces.find(s.back()) != std::string_view::npos) return 1;
    for (auto sp : kUnicodeSpaces) {
        if (s.ends_with(sp)) return sp.size();
    }
    return 0;
}

} // namespace

std::string trim(std::string_view s) {
    while (size_t n = leading_space(s)) s.remove_prefix(n);
    while (size_t n = trailing_space(s)) s.remove_suffix(n);
    return std::string(s);
}

std::vector<std::string> split_sentences(std::string_view text) {
    std::vector<std::string> result;
    std::string current;

    size_t i = 0;
    while (i < text.size()) {
        size_t len = mark_length_at(text, i);
        if (len == 0) {
            current.push_back(text[i]);
            ++i;
            continue;
        }

        std::string marks;
        while (len > 0) {
            marks.append(text.substr(i, len));
            i += len;
            len = mark_length_at(text, i);
        }

        auto sentence = trim(current);
        if (!sentence.empty()) {
            result.push_back(sentence + marks);
        }
        current.clear();
    }

    auto tail = trim(current);
    if (!tail.empty()) result.push_back(std::move(tail));

    if (result.empty()) return {std::string(text)};
    return result;
}

std::vector<SentenceSpan> locate_sentences(const std::vector<std::string>& sentences,
                                           std::string_view full_text) {
    std::vector<SentenceSpan> spans;
    spans.reserve(sentences.size());

    size_t pos = 0;
    for (const auto& sentence : sentences) {
        auto body = strip_trailing_marks(sentence);
        auto found = full_text.find(body, pos);
        size_t begin = std::min(found != std::string_view::npos ? found : pos, full_text.size());
        size_t end = std::min(begin + body.size(), full_text.size());
        spans.push_back({.begin = begin, .end = end, .found = found != std::string_view::npos});
        pos = end;
    }
    return spans;
}

std::vector<Segment> map_sentences_to_timestamps(const std::vector<std::string>& sentences,
                                                 const std::vector<WordStamp>& timestamps,
                                                 std::string_view full_text) {
    std::vector<Segment> out;
    if (sentences.empty() || timestamps.empty()) return out;

    auto spans = locate_sentences(sentences, full_text);
    auto sentence_text = [&](size_t i) {
        const auto& span = spans[i];
        if (!span.found) return sentences[i];
        auto marks = std::string_view(sentences[i]).substr(strip_trailing_marks(sentences[i]).size());
        return std::string(full_text.substr(span.begin, span.end - span.begin)) + std::string(marks);
    };

    const size_t n = timestamps.size();
    const size_t k = sentences.size();

    if (n >= k) {
        size_t per_sentence = n / k;
        size_t remainder = n % k;
        size_t idx = 0;

        for (size_t i = 0; i < k && idx < n; ++i) {
            size_t count = per_sentence + (i < remainder ? 1 : 0);
            size_t last = std::min(idx + count - 1, n - 1);
            out.push_back({
                .text = sentence_text(i),
                .start_sec = timestamps[idx].start_ms / 1000.0,
                .end_sec = timestamps[last].end_ms / 1000.0,
            });
            idx += count;
        }
    } else {
        for (size_t i = 0; i < n; ++i) {
            out.push_back({
                .text = sentence_text(i),
                .start_sec = timestamps[i].start_ms / 1000.0,
                .end_sec = timestamps[i].end_ms / 1000.0,
            });
        }
    }
    return out;
}

} // namespace segments
