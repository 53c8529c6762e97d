#include "chunker.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <algorithm>

using std::string;

Chunker::Chunker(int window_size, int overlap, int min_chunk_chars)
  : window_size_(window_size), overlap_(overlap), min_chunk_chars_(min_chunk_chars) {
  if (window_size_ <= 0)
    throw ConfigError("chunker: window_size must be > 0, got " + std::to_string(window_size_));
  if (overlap_ < 0)
    throw ConfigError("chunker: overlap must be >= 0, got " + std::to_string(overlap_));
  if (min_chunk_chars_ < 0)
    throw ConfigError("chunker: min_chunk_chars must be >= 0, got " + std::to_string(min_chunk_chars_));
  if (overlap_ >= window_size_)
    throw ConfigError("chunker: overlap (" + std::to_string(overlap_) +
                      ") must be smaller than window_size (" + std::to_string(window_size_) + ")");
}

std::vector<Chunk> Chunker::windows(const string& text) const {
  auto words = split_words(text);
  std::vector<Chunk> chunks;
  if (words.empty()) return chunks;

  const size_t n = words.size();
  const size_t size = (size_t)window_size_;
  const size_t step = (size_t)stride();
  for (size_t i = 0; i < n; i += step) {
    size_t end = std::min(n, i + size);
    string joined = join_words(words, i, end);

    // drop end-of-file fragments
    if (utf8_length(joined) > (size_t)min_chunk_chars_)
      chunks.push_back(Chunk{ i, end, std::move(joined) });
  }
  return chunks;
}

std::vector<string> Chunker::split(const string& text) const {
  auto w = windows(text);
  std::vector<string> out;
  out.reserve(w.size());
  for (auto& c : w) out.push_back(std::move(c.text));
  return out;
}
