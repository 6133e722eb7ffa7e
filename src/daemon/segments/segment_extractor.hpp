#pragma once

#include "segment.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace segments {

// Turns one model result record into timed sentences. Tries, in order:
//   1. sentence_info  [{text, start, end}]           seconds
//   2. stamp_sents    [{text_seg, punc, start, end}] milliseconds
//   3. text + timestamp [[start, end], ...]          milliseconds
// The first tier yielding any segment wins. stamp_sents and timestamp may
// arrive JSON-encoded as strings; unparseable strings count as absent.
// Never throws; returns an empty list when nothing is usable.
std::vector<Segment> extract(const nlohmann::json& record);

// True when the record carries sentence-level timing (tier 1 or 2 data).
bool has_sentence_timing(const nlohmann::json& record);

} // namespace segments
