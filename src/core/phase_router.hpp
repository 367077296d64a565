#pragma once

#include "core/error_extraction.hpp"
#include "core/segmentation_engine.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace duckdb {

//! Pipeline phases with dedicated handling; anything else is OTHER
enum class PhaseKind : uint8_t { CONFIG = 0, INSTALL = 1, WORKLOAD = 2, ORION = 3, OTHER = 255 };

std::string PhaseKindToString(PhaseKind kind);
//! Case-insensitive; unrecognized labels map to PhaseKind::OTHER
PhaseKind PhaseKindFromLabel(const std::string &label);

/**
 * Triage result for one flagged segment, ready for summarization or notification.
 */
struct PhaseErrorReport {
	PhaseKind kind = PhaseKind::OTHER;
	std::string phase_label;
	std::string step_name;
	bool has_step_name = false;
	idx_t start_line = 0;
	bool is_known_workload = false; // WORKLOAD segments only
	std::vector<ErrorLine> error_lines;
};

/**
 * Routes flagged segments to the handler for their phase and collects the reports.
 * Clean segments are skipped.
 */
class PhaseErrorRouter {
public:
	PhaseErrorRouter(const ErrorKeywordSet &keywords, const std::unordered_set<std::string> &workload_names,
	                 idx_t context_lines);

	std::vector<PhaseErrorReport> Route(const std::vector<Segment> &segments) const;

	//! Handle a single segment regardless of its flag
	PhaseErrorReport Handle(const Segment &segment) const;

private:
	PhaseErrorReport HandleConfig(const Segment &segment) const;
	PhaseErrorReport HandleInstall(const Segment &segment) const;
	PhaseErrorReport HandleWorkload(const Segment &segment) const;
	PhaseErrorReport HandleOrion(const Segment &segment) const;
	PhaseErrorReport HandleOther(const Segment &segment) const;

	PhaseErrorReport BuildReport(PhaseKind kind, const Segment &segment) const;

	const ErrorKeywordSet &keywords_;
	const std::unordered_set<std::string> &workload_names_;
	idx_t context_lines_;
};

} // namespace duckdb
