#pragma once
#include "chunker.hpp"
#include "record.hpp"
#include "sanitizer.hpp"
#include <string>
#include <vector>

// sanitize -> chunk -> {source, text}. Pure; no I/O.
class Pipeline {
public:
  Pipeline(Sanitizer sanitizer, Chunker chunker);

  std::vector<PipelineRecord> process(const std::string& source,
                                      const std::string& raw,
                                      ScrubStats* stats = nullptr) const;

  const Sanitizer& sanitizer() const { return sanitizer_; }
  const Chunker& chunker() const { return chunker_; }

private:
  Sanitizer sanitizer_;
  Chunker chunker_;
};
