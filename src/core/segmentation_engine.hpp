#pragma once

#include "core/boundary_rules.hpp"
#include "core/error_hinting.hpp"
#include "core/line_source.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * A contiguous run of log lines belonging to one phase.
 * Sealed (immutable) once emitted by the engine.
 */
struct Segment {
	std::string phase_label;
	std::string step_name;      // Captured step name; empty when has_step_name is false
	bool has_step_name = false; // False only for the implicit segment that precedes the first boundary
	idx_t start_line = 0;       // 0-based index of the line that opened the segment
	idx_t line_count = 0;       // Number of input lines assigned to this segment
	std::string body;           // Trimmed lines joined with '\n', boundary line included
	bool flagged = false;       // Some non-boundary line contained an error keyword
};

/**
 * Boundary-detecting state machine over a stream of log lines.
 *
 * Every line is trimmed and tested against the registry. A match seals the segment in
 * progress (even an empty one) and opens a new segment whose first line is the boundary
 * line itself. Other lines are scanned for error keywords - setting a sticky flag on the
 * current segment - and appended to it. When the input ends the last segment is sealed.
 *
 * The engine borrows the registry and keyword set; both must outlive it and must not be
 * modified while a run is in progress. One engine serves one run at a time.
 */
class SegmentationEngine {
public:
	SegmentationEngine(const BoundaryRuleRegistry &registry, const ErrorKeywordSet &keywords,
	                   std::string initial_phase);

	//! Segment the whole source. Errors raised by the source propagate unchanged.
	std::vector<Segment> Run(LineSource &source);

	// Incremental interface, used by Run
	void Begin();
	void ProcessLine(const std::string &raw_line);
	std::vector<Segment> Finish();

	//! The raw (untrimmed) line most recently passed to ProcessLine
	const std::string &LastSeenLine() const {
		return last_seen_line_;
	}
	idx_t LinesProcessed() const {
		return line_index_;
	}
	const std::string &InitialPhase() const {
		return initial_phase_;
	}

private:
	void FinalizeSegment();

	const BoundaryRuleRegistry &registry_;
	const ErrorKeywordSet &keywords_;
	std::string initial_phase_;

	// Per-run state
	bool running_ = false;
	std::string current_label_;
	std::string current_step_name_;
	bool current_has_step_name_ = false;
	idx_t current_start_line_ = 0;
	std::vector<std::string> buffer_;
	bool flagged_ = false;
	idx_t line_index_ = 0;
	std::string last_seen_line_;
	std::vector<Segment> segments_;
};

} // namespace duckdb
