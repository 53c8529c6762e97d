#include "patterns.hpp"
#include "errors.hpp"
#include <re2/re2.h>

const char* category_name(Category c) {
  switch (c) {
    case Category::IPV4: return "IPV4";
    case Category::EMAIL: return "EMAIL";
    case Category::SECRET_KEY: return "SECRET_KEY";
    case Category::MAC_ADDRESS: return "MAC_ADDRESS";
    case Category::CUSTOM: return "CUSTOM";
  }
  return "UNKNOWN";
}

namespace {
// Same whitespace set the tokenizer splits on; RE2's \s is only [\t\n\f\r ].
const std::string kSpace =
  R"([\t\n\x0b\f\r \x1c-\x1f\x{85}\x{a0}\x{1680}\x{2000}-\x{200a}\x{2028}\x{2029}\x{202f}\x{205f}\x{3000}])";

// Sample texts used to catch rules that match empty text at some position.
const char* const kEmptyMatchSamples[] = { "a b", "a", " ", "a.b-c:d@e", "1 x" };

bool matches_empty_somewhere(const RE2& re, const std::string& text) {
  re2::StringPiece input(text);
  re2::StringPiece m;
  for (size_t pos = 0; pos <= text.size(); ++pos) {
    if (re.Match(input, pos, text.size(), RE2::ANCHOR_START, &m, 1) && m.empty())
      return true;
  }
  return false;
}

// '\' introduces \0-\9 in RE2 rewrite strings; placeholders are literal.
std::string escape_rewrite(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}
}

PatternRegistry::PatternRegistry(const std::vector<PatternRule>& rules) {
  RE2::Options opts;
  opts.set_log_errors(false);

  patterns_.reserve(rules.size());
  for (auto& r : rules) {
    std::string name = r.name.empty() ? category_name(r.category) : r.name;
    if (r.placeholder.empty())
      throw ConfigError("pattern " + name + ": empty placeholder");

    auto re = std::make_shared<const RE2>(r.expression, opts);
    if (!re->ok())
      throw ConfigError("pattern " + name + ": " + re->error());
    if (RE2::FullMatch("", *re))
      throw ConfigError("pattern " + name + ": matches the empty string");
    bool empty_hit = matches_empty_somewhere(*re, r.placeholder);
    for (auto* sample : kEmptyMatchSamples)
      empty_hit = empty_hit || matches_empty_somewhere(*re, sample);
    if (empty_hit)
      throw ConfigError("pattern " + name + ": can match empty text");

    patterns_.push_back(SensitivePattern{ r.category, name, std::move(re),
                                          r.placeholder, escape_rewrite(r.placeholder) });
  }

  // A placeholder that re-triggers any pattern would break clean(clean(x)) == clean(x).
  for (auto& p : patterns_) {
    for (auto& q : patterns_) {
      if (RE2::PartialMatch(p.placeholder, *q.matcher))
        throw ConfigError("placeholder " + p.placeholder + " is matched by pattern " + q.name);
    }
  }
}

std::vector<PatternRule> PatternRegistry::default_rules() {
  return {
    { Category::IPV4, "IPV4",
      R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
      "[REDACTED_IP]" },
    { Category::EMAIL, "EMAIL",
      R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
      "[REDACTED_EMAIL]" },
    // keyword, ':' or '=', then a 16+ char token
    { Category::SECRET_KEY, "SECRET_KEY",
      R"((?i)\b(?:api[_-]?key|access[_-]?token|secret|password|auth))" + kSpace + "*[:=]" + kSpace +
        R"(*[A-Za-z0-9_\-]{16,}\b)",
      "[REDACTED_SECRET]" },
    { Category::MAC_ADDRESS, "MAC_ADDRESS",
      R"((?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2})",
      "[REDACTED_MAC]" },
  };
}

PatternRegistry PatternRegistry::defaults() {
  return PatternRegistry(default_rules());
}

const SensitivePattern* PatternRegistry::find(const std::string& name) const {
  for (auto& p : patterns_) if (p.name == name) return &p;
  return nullptr;
}
