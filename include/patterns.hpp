#pragma once
#include <memory>
#include <string>
#include <vector>

namespace re2 { class RE2; }

enum class Category { IPV4, EMAIL, SECRET_KEY, MAC_ADDRESS, CUSTOM };

const char* category_name(Category c);

// Uncompiled rule. `expression` is RE2 syntax.
struct PatternRule {
  Category category;
  std::string name;
  std::string expression;
  std::string placeholder;
};

struct SensitivePattern {
  Category category;
  std::string name;
  std::shared_ptr<const re2::RE2> matcher;  // shared read-only between copies
  std::string placeholder;
  std::string rewrite;                      // placeholder escaped for GlobalReplace
};

// Ordered, immutable set of detectors. Construction compiles every rule and
// throws ConfigError on a bad expression, an expression that matches the
// empty string, or a placeholder that some registered pattern would match.
class PatternRegistry {
public:
  explicit PatternRegistry(const std::vector<PatternRule>& rules);

  // IPV4, EMAIL, SECRET_KEY, MAC_ADDRESS in that order.
  static PatternRegistry defaults();
  static std::vector<PatternRule> default_rules();

  const std::vector<SensitivePattern>& patterns() const { return patterns_; }
  size_t size() const { return patterns_.size(); }

  // nullptr if no pattern has that name
  const SensitivePattern* find(const std::string& name) const;

private:
  std::vector<SensitivePattern> patterns_;
};
