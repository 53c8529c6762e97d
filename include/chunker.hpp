#pragma once
#include <string>
#include <vector>

struct Chunk {
  size_t start_token;  // inclusive
  size_t end_token;    // exclusive
  std::string text;    // tokens joined by single spaces
};

// Sliding window of words (window_size, overlap). Windows start every
// window_size - overlap tokens; a window is kept only when its length in
// characters is greater than min_chunk_chars.
// Throws ConfigError on window_size <= 0, overlap < 0, min_chunk_chars < 0
// or overlap >= window_size.
class Chunker {
public:
  explicit Chunker(int window_size=500, int overlap=50, int min_chunk_chars=50);

  std::vector<std::string> split(const std::string& text) const;
  std::vector<Chunk> windows(const std::string& text) const;

  int window_size() const { return window_size_; }
  int overlap() const { return overlap_; }
  int stride() const { return window_size_ - overlap_; }
  int min_chunk_chars() const { return min_chunk_chars_; }

private:
  int window_size_, overlap_, min_chunk_chars_;
};
