#include "pipeline.hpp"

Pipeline::Pipeline(Sanitizer sanitizer, Chunker chunker)
  : sanitizer_(std::move(sanitizer)), chunker_(chunker) {}

std::vector<PipelineRecord> Pipeline::process(const std::string& source,
                                              const std::string& raw,
                                              ScrubStats* stats) const {
  // Scrub the whole text before windowing so no secret is split across chunks.
  auto clean = sanitizer_.clean(raw, stats);
  auto chunks = chunker_.split(clean);

  std::vector<PipelineRecord> out;
  out.reserve(chunks.size());
  for (auto& c : chunks) out.push_back(PipelineRecord{ source, std::move(c) });
  return out;
}
