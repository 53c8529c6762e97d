#pragma once
#include "pipeline.hpp"
#include "record.hpp"
#include "sanitizer.hpp"
#include <iosfwd>
#include <string>
#include <vector>

struct IngestSummary {
  size_t files = 0;    // files that produced a pipeline run
  size_t chunks = 0;   // records written
  size_t skipped = 0;  // blank files
  size_t failed = 0;   // unreadable files
  ScrubStats stats;
};

// Regular files under root whose lower-cased name ends with one of exts, sorted.
// Throws std::runtime_error if root is not a directory.
std::vector<std::string> list_text_files(const std::string& root,
                                         const std::vector<std::string>& exts);

// Whole file, invalid UTF-8 dropped. Throws std::runtime_error if unreadable.
std::string read_text_file(const std::string& path);

// Runs the pipeline over every listed file and appends its records to out,
// using the file's base name as source. A file that cannot be read is
// logged and counted, the walk goes on.
IngestSummary ingest_folder(const std::string& root,
                            const std::vector<std::string>& exts,
                            const Pipeline& pipeline,
                            RecordWriter& out,
                            std::ostream& log);

// Re-scans a JSONL dataset; reports every record whose text still holds a
// sensitive match. Returns the number of such records.
size_t audit_records(std::istream& in, const Sanitizer& sanitizer, std::ostream& report);
