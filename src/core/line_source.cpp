#include "line_source.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/enums/file_compression_type.hpp"

namespace duckdb {

bool VectorLineSource::NextLine(std::string &line) {
	if (position_ >= lines_.size()) {
		return false;
	}
	line = lines_[position_++];
	return true;
}

bool ContentLineSource::NextLine(std::string &line) {
	if (position_ >= content_.size()) {
		return false;
	}
	auto end = content_.find_first_of("\r\n", position_);
	if (end == std::string::npos) {
		line = content_.substr(position_);
		position_ = content_.size();
		return true;
	}
	line = content_.substr(position_, end - position_);
	// \r\n counts as a single terminator
	if (content_[end] == '\r' && end + 1 < content_.size() && content_[end + 1] == '\n') {
		end++;
	}
	position_ = end + 1;
	return true;
}

bool ValidatePath(const std::string &path) {
	static constexpr idx_t MAX_PATH_LENGTH = 4096;
	if (path.empty() || path.size() > MAX_PATH_LENGTH || path.find('\0') != std::string::npos) {
		return false;
	}
	// Walk the components; only an exact ".." is traversal, "build...log" is a name
	idx_t component_start = 0;
	for (idx_t i = 0; i <= path.size(); i++) {
		if (i < path.size() && path[i] != '/' && path[i] != '\\') {
			continue;
		}
		if (i - component_start == 2 && path.compare(component_start, 2, "..") == 0) {
			return false;
		}
		component_start = i + 1;
	}
	return true;
}

constexpr idx_t FileLineSource::CHUNK_SIZE;

FileLineSource::FileLineSource(ClientContext &context, const std::string &path) : chunk_(CHUNK_SIZE) {
	if (!ValidatePath(path)) {
		throw InvalidInputException("Invalid file path: '%s'", path);
	}
	auto &fs = FileSystem::GetFileSystem(context);
	file_handle_ = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ | FileCompressionType::AUTO_DETECT);
}

bool FileLineSource::ReadChunk() {
	chunk_pos_ = 0;
	chunk_end_ = 0;
	if (exhausted_) {
		return false;
	}
	auto bytes_read = file_handle_->Read(chunk_.data(), chunk_.size());
	if (bytes_read <= 0) {
		exhausted_ = true;
		return false;
	}
	chunk_end_ = static_cast<idx_t>(bytes_read);
	return true;
}

bool FileLineSource::NextLine(std::string &line) {
	line.clear();
	bool has_content = false;
	while (true) {
		if (chunk_pos_ >= chunk_end_ && !ReadChunk()) {
			// A final line without terminator still counts
			return has_content;
		}
		if (after_cr_) {
			after_cr_ = false;
			if (chunk_[chunk_pos_] == '\n') {
				chunk_pos_++;
				continue;
			}
		}

		idx_t terminator = chunk_pos_;
		while (terminator < chunk_end_ && chunk_[terminator] != '\n' && chunk_[terminator] != '\r') {
			terminator++;
		}
		line.append(chunk_.data() + chunk_pos_, terminator - chunk_pos_);
		has_content = true;
		if (terminator == chunk_end_) {
			chunk_pos_ = chunk_end_;
			continue;
		}
		after_cr_ = chunk_[terminator] == '\r';
		chunk_pos_ = terminator + 1;
		return true;
	}
}

} // namespace duckdb
