#pragma once
#include "patterns.hpp"
#include <map>
#include <string>

struct ScrubStats {
  std::map<std::string, int> by_category;  // pattern name -> replacements
  int total = 0;

  void add(const std::string& name, int n);
  void merge(const ScrubStats& other);
  std::string to_string() const;
};

// Applies every registered pattern, in order, each over the output of the
// previous one. Total over arbitrary bytes; never throws on content.
// Const after construction, safe to share across threads.
class Sanitizer {
public:
  explicit Sanitizer(PatternRegistry registry = PatternRegistry::defaults());

  // "" for empty or whitespace-only input.
  std::string clean(const std::string& text) const;
  std::string clean(const std::string& text, ScrubStats* stats) const;

  // What clean() would redact, counted per pattern.
  ScrubStats scan(const std::string& text) const;

  const PatternRegistry& registry() const { return registry_; }

private:
  PatternRegistry registry_;
};
