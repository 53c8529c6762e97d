#pragma once
#include <iosfwd>
#include <string>
#include <vector>

struct PipelineRecord {
  std::string source;  // base name of the input file
  std::string text;    // one sanitized chunk
};

// One JSONL line, newline included:
//   {"source": "<source>", "text": "<text>"}\n
// Non-ASCII is written as \uXXXX escapes, invalid UTF-8 bytes are dropped.
std::string to_jsonl(const PipelineRecord& r);

// Throws RecordError unless line is an object with string "source" and "text".
PipelineRecord parse_record(const std::string& line);

// Skips blank lines. Errors name the 1-based line number.
std::vector<PipelineRecord> read_records(std::istream& in);

// Append-only record sink.
class RecordWriter {
public:
  explicit RecordWriter(std::ostream& out);

  void write(const PipelineRecord& r);
  size_t count() const { return count_; }

private:
  std::ostream& out_;
  size_t count_ = 0;
};
