#pragma once
#include <string>
#include <vector>

// Split on whitespace runs, dropping empty tokens. Whitespace is the ASCII
// set plus \x1c-\x1f and the Unicode space separators (UTF-8 encoded).
std::vector<std::string> split_words(const std::string& s);

// True if s is empty or holds whitespace only.
bool is_blank(const std::string& s);

// Number of code points in a UTF-8 string (continuation bytes not counted).
size_t utf8_length(const std::string& s);

// Drop bytes that are not part of a well-formed UTF-8 sequence.
std::string drop_invalid_utf8(const std::string& s);

std::string join_words(const std::vector<std::string>& words, size_t begin, size_t end);
