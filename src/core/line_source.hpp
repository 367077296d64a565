#pragma once

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * A finite, ordered source of text lines.
 * Line terminators are not included in the returned lines.
 */
class LineSource {
public:
	virtual ~LineSource() = default;

	//! Read the next line into `line`; returns false once the source is exhausted
	virtual bool NextLine(std::string &line) = 0;
};

//! Lines from an in-memory sequence of strings
class VectorLineSource : public LineSource {
public:
	explicit VectorLineSource(const std::vector<std::string> &lines) : lines_(lines) {
	}
	// Only a reference is kept
	explicit VectorLineSource(std::vector<std::string> &&lines) = delete;

	bool NextLine(std::string &line) override;

private:
	const std::vector<std::string> &lines_;
	idx_t position_ = 0;
};

/**
 * Lines from a single string. LF, CRLF and lone CR all terminate a line;
 * a terminator at the very end does not produce a trailing empty line.
 */
class ContentLineSource : public LineSource {
public:
	explicit ContentLineSource(const std::string &content) : content_(content) {
	}
	explicit ContentLineSource(std::string &&content) = delete;

	bool NextLine(std::string &line) override;

private:
	const std::string &content_;
	idx_t position_ = 0;
};

/**
 * Chunked line reader over DuckDB's FileSystem, splitting exactly like
 * ContentLineSource: LF, CRLF and lone CR end a line, and a CRLF pair split
 * across two reads still counts once. Lines longer than a chunk are assembled
 * across reads. Compression (.gz, .zst, ...) is detected from the file extension.
 * Open and read failures propagate as DuckDB exceptions.
 */
class FileLineSource : public LineSource {
public:
	FileLineSource(ClientContext &context, const std::string &path);

	bool NextLine(std::string &line) override;

	static constexpr idx_t CHUNK_SIZE = 65536;

private:
	//! Replace the chunk with the next block of the file; false at end of file
	bool ReadChunk();

	unique_ptr<FileHandle> file_handle_;
	std::vector<char> chunk_;
	idx_t chunk_pos_ = 0;
	idx_t chunk_end_ = 0;
	bool exhausted_ = false;
	// The previous line ended in '\r'; a '\n' that follows belongs to it
	bool after_cr_ = false;
};

/**
 * Reject paths that are empty, longer than 4096 bytes, contain a null byte
 * or have a ".." component.
 */
bool ValidatePath(const std::string &path);

} // namespace duckdb
