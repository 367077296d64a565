#include "phase_router.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

std::string PhaseKindToString(PhaseKind kind) {
	switch (kind) {
	case PhaseKind::CONFIG:
		return "config";
	case PhaseKind::INSTALL:
		return "install";
	case PhaseKind::WORKLOAD:
		return "workload";
	case PhaseKind::ORION:
		return "orion";
	case PhaseKind::OTHER:
		return "other";
	default:
		return "other";
	}
}

PhaseKind PhaseKindFromLabel(const std::string &label) {
	std::string upper = StringUtil::Upper(label);
	if (upper == "CONFIG")
		return PhaseKind::CONFIG;
	if (upper == "INSTALL")
		return PhaseKind::INSTALL;
	if (upper == "WORKLOAD")
		return PhaseKind::WORKLOAD;
	if (upper == "ORION")
		return PhaseKind::ORION;
	return PhaseKind::OTHER;
}

PhaseErrorRouter::PhaseErrorRouter(const ErrorKeywordSet &keywords,
                                   const std::unordered_set<std::string> &workload_names, idx_t context_lines)
    : keywords_(keywords), workload_names_(workload_names), context_lines_(context_lines) {
}

std::vector<PhaseErrorReport> PhaseErrorRouter::Route(const std::vector<Segment> &segments) const {
	std::vector<PhaseErrorReport> reports;
	for (const auto &segment : segments) {
		if (segment.flagged) {
			reports.push_back(Handle(segment));
		}
	}
	return reports;
}

PhaseErrorReport PhaseErrorRouter::Handle(const Segment &segment) const {
	switch (PhaseKindFromLabel(segment.phase_label)) {
	case PhaseKind::CONFIG:
		return HandleConfig(segment);
	case PhaseKind::INSTALL:
		return HandleInstall(segment);
	case PhaseKind::WORKLOAD:
		return HandleWorkload(segment);
	case PhaseKind::ORION:
		return HandleOrion(segment);
	default:
		return HandleOther(segment);
	}
}

PhaseErrorReport PhaseErrorRouter::BuildReport(PhaseKind kind, const Segment &segment) const {
	PhaseErrorReport report;
	report.kind = kind;
	report.phase_label = segment.phase_label;
	report.step_name = segment.step_name;
	report.has_step_name = segment.has_step_name;
	report.start_line = segment.start_line;
	report.error_lines = ExtractErrorLines(segment, keywords_, context_lines_);
	return report;
}

PhaseErrorReport PhaseErrorRouter::HandleConfig(const Segment &segment) const {
	return BuildReport(PhaseKind::CONFIG, segment);
}

PhaseErrorReport PhaseErrorRouter::HandleInstall(const Segment &segment) const {
	return BuildReport(PhaseKind::INSTALL, segment);
}

PhaseErrorReport PhaseErrorRouter::HandleWorkload(const Segment &segment) const {
	auto report = BuildReport(PhaseKind::WORKLOAD, segment);
	report.is_known_workload =
	    segment.has_step_name && workload_names_.find(segment.step_name) != workload_names_.end();
	return report;
}

PhaseErrorReport PhaseErrorRouter::HandleOrion(const Segment &segment) const {
	return BuildReport(PhaseKind::ORION, segment);
}

PhaseErrorReport PhaseErrorRouter::HandleOther(const Segment &segment) const {
	return BuildReport(PhaseKind::OTHER, segment);
}

} // namespace duckdb
