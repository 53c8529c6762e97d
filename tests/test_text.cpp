#include "text.hpp"
#include <gtest/gtest.h>

TEST(Text, SplitsOnWhitespaceRuns) {
  auto w = split_words("  alpha\tbeta\n\n gamma  ");
  ASSERT_EQ(w.size(), 3u);
  EXPECT_EQ(w[0], "alpha");
  EXPECT_EQ(w[1], "beta");
  EXPECT_EQ(w[2], "gamma");
}

TEST(Text, SplitsOnUnicodeSpaces) {
  // NBSP, ideographic space, line separator
  auto w = split_words("a\xc2\xa0" "b\xe3\x80\x80" "c\xe2\x80\xa8" "d");
  ASSERT_EQ(w.size(), 4u);
  EXPECT_EQ(w[3], "d");
}

TEST(Text, KeepsNonSpaceMultibyteCharacters) {
  auto w = split_words("caf\xc3\xa9 na\xc3\xafve");
  ASSERT_EQ(w.size(), 2u);
  EXPECT_EQ(w[0], "caf\xc3\xa9");
}

TEST(Text, EmptyInputHasNoWords) {
  EXPECT_TRUE(split_words("").empty());
  EXPECT_TRUE(split_words(" \t\r\n\v\f").empty());
}

TEST(Text, BlankDetection) {
  EXPECT_TRUE(is_blank(""));
  EXPECT_TRUE(is_blank(" \t\n"));
  EXPECT_TRUE(is_blank("\xe3\x80\x80\x1f"));
  EXPECT_FALSE(is_blank("  x "));
}

TEST(Text, Utf8LengthCountsCodePoints) {
  EXPECT_EQ(utf8_length(""), 0u);
  EXPECT_EQ(utf8_length("hello"), 5u);
  EXPECT_EQ(utf8_length("h\xc3\xa9llo"), 5u);
  EXPECT_EQ(utf8_length("\xf0\x9f\x98\x80"), 1u);
}

TEST(Text, DropsInvalidUtf8) {
  EXPECT_EQ(drop_invalid_utf8("a\xff" "b"), "ab");
  EXPECT_EQ(drop_invalid_utf8("caf\xc3\xa9"), "caf\xc3\xa9");
  // overlong '/'
  EXPECT_EQ(drop_invalid_utf8("\xc0\xaf"), "");
  // truncated sequence at the end
  EXPECT_EQ(drop_invalid_utf8("ok\xe2\x82"), "ok");
}

TEST(Text, JoinWordsClipsRange) {
  std::vector<std::string> w = {"a", "b", "c"};
  EXPECT_EQ(join_words(w, 0, 3), "a b c");
  EXPECT_EQ(join_words(w, 1, 10), "b c");
  EXPECT_EQ(join_words(w, 2, 2), "");
}
