#include "text.hpp"

namespace {

// Length of the whitespace sequence starting at s[i], 0 if none.
size_t space_at(const std::string& s, size_t i) {
  unsigned char c = (unsigned char)s[i];
  if (c == ' ' || (c >= 0x09 && c <= 0x0d) || (c >= 0x1c && c <= 0x1f)) return 1;

  auto byte = [&](size_t k) -> unsigned char {
    return i + k < s.size() ? (unsigned char)s[i + k] : 0;
  };
  if (c == 0xc2) {
    // U+0085, U+00A0
    if (byte(1) == 0x85 || byte(1) == 0xa0) return 2;
  } else if (c == 0xe1) {
    // U+1680
    if (byte(1) == 0x9a && byte(2) == 0x80) return 3;
  } else if (c == 0xe2) {
    unsigned char b1 = byte(1), b2 = byte(2);
    // U+2000..U+200A, U+2028, U+2029, U+202F
    if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8a) || b2 == 0xa8 || b2 == 0xa9 || b2 == 0xaf)) return 3;
    // U+205F
    if (b1 == 0x81 && b2 == 0x9f) return 3;
  } else if (c == 0xe3) {
    // U+3000
    if (byte(1) == 0x80 && byte(2) == 0x80) return 3;
  }
  return 0;
}

// Length of a well-formed UTF-8 sequence at s[i], 0 if malformed.
size_t utf8_seq_at(const std::string& s, size_t i) {
  unsigned char c = (unsigned char)s[i];
  if (c < 0x80) return 1;
  size_t n;
  unsigned int cp;
  if ((c & 0xe0) == 0xc0) { n = 2; cp = c & 0x1f; }
  else if ((c & 0xf0) == 0xe0) { n = 3; cp = c & 0x0f; }
  else if ((c & 0xf8) == 0xf0) { n = 4; cp = c & 0x07; }
  else return 0;
  if (i + n > s.size()) return 0;
  for (size_t k = 1; k < n; ++k) {
    unsigned char b = (unsigned char)s[i + k];
    if ((b & 0xc0) != 0x80) return 0;
    cp = (cp << 6) | (b & 0x3f);
  }
  // overlong forms, surrogates, out of range
  if ((n == 2 && cp < 0x80) || (n == 3 && cp < 0x800) || (n == 4 && cp < 0x10000)) return 0;
  if (cp >= 0xd800 && cp <= 0xdfff) return 0;
  if (cp > 0x10ffff) return 0;
  return n;
}

}

std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0, start = 0;
  bool in_word = false;
  while (i < s.size()) {
    size_t w = space_at(s, i);
    if (w) {
      if (in_word) { out.emplace_back(s, start, i - start); in_word = false; }
      i += w;
    } else {
      if (!in_word) { start = i; in_word = true; }
      ++i;
    }
  }
  if (in_word) out.emplace_back(s, start, s.size() - start);
  return out;
}

bool is_blank(const std::string& s) {
  for (size_t i = 0; i < s.size(); ) {
    size_t w = space_at(s, i);
    if (!w) return false;
    i += w;
  }
  return true;
}

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) if ((c & 0xc0) != 0x80) ++n;
  return n;
}

std::string drop_invalid_utf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ) {
    size_t n = utf8_seq_at(s, i);
    if (n) { out.append(s, i, n); i += n; }
    else ++i;
  }
  return out;
}

std::string join_words(const std::vector<std::string>& words, size_t begin, size_t end) {
  std::string out;
  if (end > words.size()) end = words.size();
  size_t total = 0;
  for (size_t i = begin; i < end; ++i) total += words[i].size() + 1;
  out.reserve(total);
  for (size_t i = begin; i < end; ++i) {
    if (i != begin) out.push_back(' ');
    out += words[i];
  }
  return out;
}
