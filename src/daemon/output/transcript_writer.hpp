#pragma once

#include "errors.hpp"
#include "segments/segment.hpp"

#include <string>
#include <vector>

namespace transcript {

// HH:MM:SS,mmm, rounded to the nearest millisecond. Negative input clamps to 0.
std::string format_timestamp(double seconds);

// One "[start --> end] text" line per segment.
std::string render_plaintext(const std::vector<Segment>& segments);

// Numbered SRT cues separated by blank lines.
std::string render_srt(const std::vector<Segment>& segments);

// {"generated_at": ..., "segments": [...]}, pretty-printed.
std::string render_json(const std::vector<Segment>& segments, const std::string& generated_at);

// Local time as YYYY-MM-DDTHH:MM:SS.
std::string now_iso8601();

// Writes segments.json and transcript.txt (plus subtitles.srt when
// with_srt) into output_dir, creating it if needed. Returns the paths
// written.
Result<std::vector<std::string>> write_artifacts(const std::vector<Segment>& segments,
                                                 const std::string& output_dir, bool with_srt);

} // namespace transcript
