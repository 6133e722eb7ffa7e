#pragma once

#include "segment.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace segments {

// One word-level span as reported by the model, in milliseconds.
struct WordStamp {
    double start_ms = 0.0;
    double end_ms = 0.0;
};

// Byte range of a sentence inside the full transcript text.
struct SentenceSpan {
    size_t begin = 0;
    size_t end = 0;
    // False when the sentence was placed at the scan position instead.
    bool found = false;
};

// Split on full-width sentence-final marks (。！？；). A run of marks is one
// boundary and stays attached to the sentence it terminates. Returns the
// whole text as a single sentence when no non-empty fragment is found.
std::vector<std::string> split_sentences(std::string_view text);

// Left-to-right, non-overlapping search for each sentence (without its
// trailing marks) in full_text. A sentence that cannot be found is placed
// at the current scan position.
std::vector<SentenceSpan> locate_sentences(const std::vector<std::string>& sentences,
                                           std::string_view full_text);

// Distribute word stamps over sentences. With at least as many stamps as
// sentences, stamps are split into contiguous groups of n/k, the first n%k
// groups taking one extra. With fewer stamps, sentence i takes stamp i and
// sentences past the last stamp are dropped.
// Segment text is the sentence's located span in full_text plus its marks,
// or the sentence itself when it was not found there.
std::vector<Segment> map_sentences_to_timestamps(const std::vector<std::string>& sentences,
                                                 const std::vector<WordStamp>& timestamps,
                                                 std::string_view full_text);

// Strips ASCII and Unicode white space, including the ideographic space.
std::string trim(std::string_view s);

} // namespace segments
