#include "boundary_rules.hpp"
#include "core/trace.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include <cstring>

namespace duckdb {

// Inline case-insensitivity flag as written in Python-flavoured rule sets
static constexpr const char *INLINE_ICASE_FLAG = "(?i)";

// Lines longer than this are never treated as boundaries.
// libstdc++'s std::regex recurses per character and can exhaust the stack on huge lines.
static constexpr idx_t MAX_BOUNDARY_LINE_LENGTH = 2000;

// Python-style named groups, rewritten to plain groups for std::regex
static const std::regex RE_NAMED_GROUP_STRIP(R"(\(\?P?<[a-zA-Z_][a-zA-Z0-9_]*>)");

CaptureGroupInfo ScanCaptureGroups(const std::string &pattern) {
	CaptureGroupInfo info;
	std::vector<bool> open_groups; // true for capturing groups
	idx_t capture_depth = 0;
	bool in_class = false;

	for (idx_t i = 0; i < pattern.size(); i++) {
		char c = pattern[i];
		if (c == '\\') {
			i++;
			continue;
		}
		if (in_class) {
			if (c == ']') {
				in_class = false;
			}
			continue;
		}
		if (c == '[') {
			in_class = true;
		} else if (c == '(') {
			bool capturing = !(i + 1 < pattern.size() && pattern[i + 1] == '?');
			if (capturing) {
				info.total_groups++;
				if (capture_depth == 0) {
					info.outermost_groups++;
					if (info.step_group_index == 0) {
						info.step_group_index = info.total_groups;
					}
				}
				capture_depth++;
			}
			open_groups.push_back(capturing);
		} else if (c == ')') {
			if (!open_groups.empty()) {
				if (open_groups.back()) {
					capture_depth--;
				}
				open_groups.pop_back();
			}
		}
	}
	return info;
}

BoundaryRule BoundaryRule::Compile(const std::string &label, const std::string &pattern, bool case_sensitive) {
	if (label.empty()) {
		throw InvalidInputException("Boundary rule label must not be empty (pattern '%s')", pattern);
	}

	BoundaryRule rule;
	rule.label = label;
	rule.original_pattern = pattern;
	rule.case_sensitive = case_sensitive;

	std::string source = pattern;
	if (StringUtil::StartsWith(source, INLINE_ICASE_FLAG)) {
		source = source.substr(std::strlen(INLINE_ICASE_FLAG));
		rule.case_sensitive = false;
	}
	source = std::regex_replace(source, RE_NAMED_GROUP_STRIP, "(");

	auto groups = ScanCaptureGroups(source);
	if (groups.outermost_groups != 1) {
		throw InvalidInputException(
		    "Boundary rule '%s' must contain exactly one capturing group for the step name, found %llu: %s", label,
		    groups.outermost_groups, pattern);
	}
	rule.step_group_index = groups.step_group_index;

	auto flags = std::regex::ECMAScript;
	if (!rule.case_sensitive) {
		flags |= std::regex::icase;
	}
	try {
		rule.compiled_regex = std::regex(source, flags);
	} catch (const std::regex_error &e) {
		throw InvalidInputException("Invalid regex for boundary rule '%s' ('%s'): %s", label, pattern, e.what());
	}

	// The scanner and the regex engine must agree, otherwise the step name would come from the wrong group
	if (rule.compiled_regex.mark_count() != groups.total_groups) {
		throw InvalidInputException("Boundary rule '%s' has an unsupported group construct: %s", label, pattern);
	}
	return rule;
}

void BoundaryRuleRegistry::Register(const std::string &label, const std::string &pattern) {
	rules_.push_back(BoundaryRule::Compile(label, pattern, case_sensitive_));
	BUILD_PHASES_TRACE("registered rule #" << rules_.size() << " " << label << " -> " << pattern);
}

bool BoundaryRuleRegistry::Match(const std::string &line, BoundaryMatch &match) const {
	if (line.length() > MAX_BOUNDARY_LINE_LENGTH) {
		BUILD_PHASES_TRACE("skipped boundary matching on a " << line.length() << " character line (limit "
		                                                     << MAX_BOUNDARY_LINE_LENGTH << ")");
		return false;
	}
	std::smatch result;
	for (idx_t i = 0; i < rules_.size(); i++) {
		const auto &rule = rules_[i];
		if (!std::regex_search(line, result, rule.compiled_regex)) {
			continue;
		}
		match.rule_index = i;
		match.label = rule.label;
		match.step_name = result[rule.step_group_index].str();
		return true;
	}
	return false;
}

} // namespace duckdb
