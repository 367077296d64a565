#include "error_extraction.hpp"

namespace duckdb {

std::vector<std::string> SplitSegmentBody(const Segment &segment) {
	std::vector<std::string> lines;
	if (segment.line_count == 0) {
		return lines;
	}
	lines.reserve(segment.line_count);
	idx_t start = 0;
	while (true) {
		auto end = segment.body.find('\n', start);
		if (end == std::string::npos) {
			lines.push_back(segment.body.substr(start));
			break;
		}
		lines.push_back(segment.body.substr(start, end - start));
		start = end + 1;
	}
	return lines;
}

std::vector<ErrorLine> ExtractErrorLines(const Segment &segment, const ErrorKeywordSet &keywords,
                                         idx_t context_lines) {
	std::vector<ErrorLine> result;
	auto lines = SplitSegmentBody(segment);
	if (lines.empty()) {
		return result;
	}

	// A boundary segment starts with the boundary line, which is never scanned
	idx_t first_scanned = segment.has_step_name ? 1 : 0;
	std::vector<bool> is_match(lines.size(), false);
	std::vector<bool> selected(lines.size(), false);
	for (idx_t i = first_scanned; i < lines.size(); i++) {
		if (!keywords.Matches(lines[i])) {
			continue;
		}
		is_match[i] = true;
		idx_t window_start = i > context_lines ? i - context_lines : 0;
		idx_t last = lines.size() - 1;
		idx_t window_end = context_lines >= last - i ? last : i + context_lines;
		for (idx_t j = window_start; j <= window_end; j++) {
			selected[j] = true;
		}
	}

	for (idx_t i = 0; i < lines.size(); i++) {
		if (selected[i]) {
			result.push_back(ErrorLine {segment.start_line + i, lines[i], is_match[i]});
		}
	}
	return result;
}

} // namespace duckdb
