#include "errors.hpp"
#include "patterns.hpp"
#include <gtest/gtest.h>
#include <re2/re2.h>

TEST(PatternRegistry, DefaultsInOrder) {
  auto reg = PatternRegistry::defaults();
  ASSERT_EQ(reg.size(), 4u);
  EXPECT_EQ(reg.patterns()[0].category, Category::IPV4);
  EXPECT_EQ(reg.patterns()[1].category, Category::EMAIL);
  EXPECT_EQ(reg.patterns()[2].category, Category::SECRET_KEY);
  EXPECT_EQ(reg.patterns()[3].category, Category::MAC_ADDRESS);

  EXPECT_EQ(reg.patterns()[0].placeholder, "[REDACTED_IP]");
  EXPECT_EQ(reg.patterns()[1].placeholder, "[REDACTED_EMAIL]");
  EXPECT_EQ(reg.patterns()[2].placeholder, "[REDACTED_SECRET]");
  EXPECT_EQ(reg.patterns()[3].placeholder, "[REDACTED_MAC]");
}

TEST(PatternRegistry, PlaceholdersNeverMatchAnyPattern) {
  auto reg = PatternRegistry::defaults();
  for (auto& p : reg.patterns())
    for (auto& q : reg.patterns())
      EXPECT_FALSE(RE2::PartialMatch(p.placeholder, *q.matcher)) << p.placeholder << " vs " << q.name;
}

struct Sample { const char* pattern; const char* text; bool hit; };

TEST(PatternRegistry, EachEntryMatchesItsCategory) {
  auto reg = PatternRegistry::defaults();
  const Sample samples[] = {
    {"IPV4", "192.168.0.55", true},
    {"IPV4", "999.999.999.999", true},   // syntax only
    {"IPV4", "1.2.3", false},
    {"EMAIL", "admin@company.com", true},
    {"EMAIL", "a.b+tag@mail.example.org", true},
    {"EMAIL", "user@localhost", false},
    {"EMAIL", "user@host.c", false},
    {"SECRET_KEY", "api_key=sk-abC12345678901234567890abcdef", true},
    {"SECRET_KEY", "API-KEY : ABCDEFGHIJKLMNOP", true},
    {"SECRET_KEY", "Password = abcdefghijklmnop", true},
    {"SECRET_KEY", "access_token:0123456789abcdef", true},
    {"SECRET_KEY", "password\x0b=AAAAAAAAAAAAAAAAAAAA", true},
    {"SECRET_KEY", "password\xc2\xa0=\xc2\xa0" "AAAAAAAAAAAAAAAAAAAA", true},
    {"SECRET_KEY", "api_key=\x1f" "AAAAAAAAAAAAAAAAAAAA", true},
    {"SECRET_KEY", "password=abcdefghijklmno", false},  // 15 chars
    {"SECRET_KEY", "token=abcdefghijklmnopqrstu", false},
    {"MAC_ADDRESS", "00:1B:44:11:3A:B7", true},
    {"MAC_ADDRESS", "00-1b-44-11-3a-b7", true},
    {"MAC_ADDRESS", "00:1B:44:11:3A", false},
  };
  for (auto& s : samples) {
    auto* p = reg.find(s.pattern);
    ASSERT_NE(p, nullptr) << s.pattern;
    EXPECT_EQ(RE2::PartialMatch(s.text, *p->matcher), s.hit) << s.pattern << ": " << s.text;
  }
}

TEST(PatternRegistry, MatchersIgnoreNonAscii) {
  auto reg = PatternRegistry::defaults();
  for (auto& p : reg.patterns())
    EXPECT_FALSE(RE2::PartialMatch("\xd9\xa1\xd9\xa2\xd9\xa3 \xe2\x91\xa0 \xc3\xa9t\xc3\xa9", *p.matcher)) << p.name;
}

TEST(PatternRegistry, FindByName) {
  auto reg = PatternRegistry::defaults();
  ASSERT_NE(reg.find("EMAIL"), nullptr);
  EXPECT_EQ(reg.find("EMAIL")->category, Category::EMAIL);
  EXPECT_EQ(reg.find("PHONE"), nullptr);
}

TEST(PatternRegistry, ExtendsWithCustomRules) {
  auto rules = PatternRegistry::default_rules();
  rules.push_back({Category::CUSTOM, "PHONE", R"(\b\d{3}-\d{3}-\d{4}\b)", "[REDACTED_PHONE]"});
  PatternRegistry reg(rules);
  ASSERT_EQ(reg.size(), 5u);
  EXPECT_EQ(reg.patterns().back().name, "PHONE");
  EXPECT_STREQ(category_name(reg.patterns().back().category), "CUSTOM");
}

TEST(PatternRegistry, CopiesShareCompiledMatchers) {
  auto a = PatternRegistry::defaults();
  PatternRegistry b = a;
  EXPECT_EQ(a.patterns()[0].matcher.get(), b.patterns()[0].matcher.get());
}

static PatternRegistry single(const char* name, const char* expr, const char* placeholder) {
  return PatternRegistry(std::vector<PatternRule>{ PatternRule{Category::CUSTOM, name, expr, placeholder} });
}

TEST(PatternRegistry, RejectsBadRules) {
  EXPECT_THROW(single("BAD", "(unclosed", "[X]"), ConfigError);
  EXPECT_THROW(single("EMPTY", "a*", "[X]"), ConfigError);
  EXPECT_THROW(single("NOPH", "abc", ""), ConfigError);
  EXPECT_NO_THROW(single("OK", "abc", "[X]"));
}

TEST(PatternRegistry, RejectsRulesMatchingEmptyTextMidString) {
  // would insert the placeholder at every word boundary
  EXPECT_THROW(single("EDGE", R"(\b)", "<>"), ConfigError);
  EXPECT_THROW(single("OPTX", R"(x?\b)", "<>"), ConfigError);
  EXPECT_THROW(single("ALT", R"((?:^a|\b))", "<>"), ConfigError);
  EXPECT_NO_THROW(single("WORD", R"(\bkey\b)", "<>"));
}

TEST(PatternRegistry, RejectsPlaceholderThatRetriggers) {
  // matches its own placeholder
  EXPECT_THROW(single("WORD", "REDACTED", "[REDACTED]"), ConfigError);

  // matches another pattern's placeholder
  auto rules = PatternRegistry::default_rules();
  rules.push_back({Category::CUSTOM, "IPTAG", R"(_IP\b)", "[X]"});
  EXPECT_THROW(PatternRegistry{rules}, ConfigError);
}
