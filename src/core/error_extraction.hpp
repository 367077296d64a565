#pragma once

#include "core/error_hinting.hpp"
#include "core/segmentation_engine.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * One line selected from a flagged segment.
 */
struct ErrorLine {
	idx_t line_number;   // 0-based index in the original log
	std::string content; // Trimmed line text
	bool is_match;       // Contains an error keyword (false for context lines)
};

//! Split a segment body back into its lines; an empty segment yields no lines
std::vector<std::string> SplitSegmentBody(const Segment &segment);

/**
 * Select the suspect lines of a segment: every line containing an error keyword,
 * plus up to `context_lines` neighbours on each side (clamped to the segment,
 * overlapping windows merged). The boundary line that opened the segment is
 * never a match but may appear as context.
 */
std::vector<ErrorLine> ExtractErrorLines(const Segment &segment, const ErrorKeywordSet &keywords,
                                         idx_t context_lines);

} // namespace duckdb
