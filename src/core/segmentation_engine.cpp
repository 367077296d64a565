#include "segmentation_engine.hpp"
#include "core/trace.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

SegmentationEngine::SegmentationEngine(const BoundaryRuleRegistry &registry, const ErrorKeywordSet &keywords,
                                       std::string initial_phase)
    : registry_(registry), keywords_(keywords), initial_phase_(std::move(initial_phase)) {
}

std::vector<Segment> SegmentationEngine::Run(LineSource &source) {
	Begin();
	std::string line;
	while (source.NextLine(line)) {
		ProcessLine(line);
	}
	return Finish();
}

void SegmentationEngine::Begin() {
	running_ = true;
	current_label_ = initial_phase_;
	current_step_name_.clear();
	current_has_step_name_ = false;
	current_start_line_ = 0;
	buffer_.clear();
	flagged_ = false;
	line_index_ = 0;
	last_seen_line_.clear();
	segments_.clear();
}

void SegmentationEngine::ProcessLine(const std::string &raw_line) {
	if (!running_) {
		throw InternalException("SegmentationEngine::ProcessLine called outside of Begin/Finish");
	}
	last_seen_line_ = raw_line;
	std::string line = raw_line;
	StringUtil::Trim(line);

	BoundaryMatch match;
	if (registry_.Match(line, match)) {
		FinalizeSegment();
		current_label_ = std::move(match.label);
		current_step_name_ = std::move(match.step_name);
		current_has_step_name_ = true;
		current_start_line_ = line_index_;
		buffer_.push_back(std::move(line));
		line_index_++;
		return;
	}

	if (!flagged_ && keywords_.Matches(line)) {
		flagged_ = true;
	}
	buffer_.push_back(std::move(line));
	line_index_++;
}

std::vector<Segment> SegmentationEngine::Finish() {
	if (!running_) {
		throw InternalException("SegmentationEngine::Finish called without Begin");
	}
	FinalizeSegment();
	running_ = false;
	BUILD_PHASES_TRACE("segmented " << line_index_ << " lines into " << segments_.size() << " segments");
	return std::move(segments_);
}

void SegmentationEngine::FinalizeSegment() {
	Segment segment;
	segment.phase_label = current_label_;
	segment.step_name = current_step_name_;
	segment.has_step_name = current_has_step_name_;
	segment.start_line = current_start_line_;
	segment.line_count = buffer_.size();
	for (idx_t i = 0; i < buffer_.size(); i++) {
		if (i > 0) {
			segment.body += '\n';
		}
		segment.body += buffer_[i];
	}
	segment.flagged = flagged_;
	segments_.push_back(std::move(segment));

	buffer_.clear();
	flagged_ = false;
}

} // namespace duckdb
