#include "sanitizer.hpp"
#include "text.hpp"
#include <re2/re2.h>
#include <sstream>

void ScrubStats::add(const std::string& name, int n) {
  if (n <= 0) return;
  by_category[name] += n;
  total += n;
}

void ScrubStats::merge(const ScrubStats& other) {
  for (auto& kv : other.by_category) add(kv.first, kv.second);
}

std::string ScrubStats::to_string() const {
  std::ostringstream ss;
  ss << total << " redacted";
  if (!by_category.empty()) {
    ss << " (";
    bool first = true;
    for (auto& kv : by_category) {
      if (!first) ss << ", ";
      ss << kv.first << ":" << kv.second;
      first = false;
    }
    ss << ")";
  }
  return ss.str();
}

namespace {
const int kMaxPasses = 8;
}

Sanitizer::Sanitizer(PatternRegistry registry) : registry_(std::move(registry)) {}

std::string Sanitizer::clean(const std::string& text) const {
  return clean(text, nullptr);
}

std::string Sanitizer::clean(const std::string& text, ScrubStats* stats) const {
  if (is_blank(text)) return "";

  std::string out = text;
  // Every pattern runs over the whole string; no short-circuit. A placeholder
  // can open a word boundary for an earlier pattern ("1.2.3.4ab:cd:..."), so
  // the list is re-run until a pass replaces nothing.
  for (int pass = 0; pass < kMaxPasses; ++pass) {
    int replaced = 0;
    for (auto& p : registry_.patterns()) {
      int n = RE2::GlobalReplace(&out, *p.matcher, p.rewrite);
      if (stats) stats->add(p.name, n);
      replaced += n;
    }
    if (!replaced) break;
  }
  return out;
}

ScrubStats Sanitizer::scan(const std::string& text) const {
  ScrubStats stats;
  clean(text, &stats);
  return stats;
}
