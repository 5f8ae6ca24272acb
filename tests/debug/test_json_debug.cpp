#include "debug/json_debug.hpp"
#include <gtest/gtest.h>

using namespace tc;
using json = nlohmann::json;
using LineCol = std::pair<size_t, size_t>;

TEST(JsonDebug, LineAndColumn) {
  const std::string s = "ab\ncd\nef";
  EXPECT_EQ(calc_line_col(s, 0), (LineCol(1, 1)));
  EXPECT_EQ(calc_line_col(s, 2), (LineCol(1, 3))); // the newline itself
  EXPECT_EQ(calc_line_col(s, 4), (LineCol(2, 2)));
  EXPECT_EQ(calc_line_col(s, 6), (LineCol(3, 1)));
  // clamped to the end of the text
  EXPECT_EQ(calc_line_col(s, 100), (LineCol(3, 3)));
}

TEST(JsonDebug, SnippetPointsAtOffendingColumn) {
  const std::string s = "first line\nsecond line\nthird";
  const std::string snip = context_snippet(s, 18); // 'l' of "line" on line 2
  EXPECT_EQ(snip, "second line\n       ^");
}

TEST(JsonDebug, DescribesParseError) {
  const std::string text = "[\n  {\"lat\": 1,\n  }\n]";
  try {
    (void)json::parse(text);
    FAIL() << "expected parse_error";
  } catch (const json::parse_error &e) {
    const json d = describe_parse_error(text, e);
    EXPECT_EQ(d.at("ok"), false);
    EXPECT_EQ(d.at("kind"), "parse_error");
    EXPECT_EQ(d.at("line"), 3);
    EXPECT_NE(d.at("context").get<std::string>().find('^'), std::string::npos);
  }
}
