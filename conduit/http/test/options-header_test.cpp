#include "conduit/options-header.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace conduit {

TEST(OptionsHeaderTest, ValueOnly) {
  const auto header = ParseOptionsHeader("application/json");
  EXPECT_EQ(header.value, "application/json");
  EXPECT_TRUE(header.options.empty());
}

TEST(OptionsHeaderTest, EmptyHeader) {
  const auto header = ParseOptionsHeader("");
  EXPECT_TRUE(header.value.empty());
  EXPECT_TRUE(header.options.empty());
}

TEST(OptionsHeaderTest, SimpleOption) {
  const auto header = ParseOptionsHeader("text/plain; charset=utf-8");
  EXPECT_EQ(header.value, "text/plain");
  ASSERT_EQ(header.options.size(), 1U);
  EXPECT_EQ(header.options[0].name, "charset");
  EXPECT_EQ(header.option("charset"), "utf-8");
}

TEST(OptionsHeaderTest, OptionLookupIgnoresCase) {
  const auto header = ParseOptionsHeader("text/html; Charset=latin-1");
  EXPECT_EQ(header.option("CHARSET"), "latin-1");
  EXPECT_FALSE(header.option("boundary").has_value());
}

TEST(OptionsHeaderTest, PrimaryValueIsTrimmed) {
  const auto header = ParseOptionsHeader("  form-data  ; name=field");
  EXPECT_EQ(header.value, "form-data");
  EXPECT_EQ(header.option("name"), "field");
}

TEST(OptionsHeaderTest, QuotedValuesAreUnescaped) {
  const auto header = ParseOptionsHeader(R"(form-data; name="upload"; filename="my \"big\" file.txt")");
  EXPECT_EQ(header.value, "form-data");
  EXPECT_EQ(header.option("name"), "upload");
  EXPECT_EQ(header.option("filename"), R"(my "big" file.txt)");
}

TEST(OptionsHeaderTest, QuotedValueMayContainSeparators) {
  const auto header = ParseOptionsHeader(R"(form-data; filename="a;b,c.txt"; name=x)");
  EXPECT_EQ(header.option("filename"), "a;b,c.txt");
  EXPECT_EQ(header.option("name"), "x");
}

TEST(OptionsHeaderTest, ContinuationsAreJoined) {
  const auto header = ParseOptionsHeader("message/external-body; key*0=foo; key*1=bar");
  EXPECT_EQ(header.option("key"), "foobar");
}

TEST(OptionsHeaderTest, ContinuationsAreJoinedInIndexOrder) {
  const auto header = ParseOptionsHeader("message/external-body; key*1=bar; key*0=foo; key*2=baz");
  EXPECT_EQ(header.option("key"), "foobarbaz");
}

TEST(OptionsHeaderTest, ExtendedValueIsDecodedWithItsCharset) {
  const auto header = ParseOptionsHeader("attachment; filename*=UTF-8''%E2%82%AC%20rates");
  EXPECT_EQ(header.value, "attachment");
  EXPECT_EQ(header.option("filename"), "\xE2\x82\xAC rates");
}

TEST(OptionsHeaderTest, ExtendedValueWithLanguage) {
  const auto header = ParseOptionsHeader("attachment; title*=iso-8859-1'en'%A3%20rates");
  EXPECT_EQ(header.option("title"), "\xC2\xA3 rates");
}

TEST(OptionsHeaderTest, ExtendedValueWithUnknownCharsetKeepsBytes) {
  const auto header = ParseOptionsHeader("attachment; filename*=klingon''abc%41");
  EXPECT_EQ(header.option("filename"), "abcA");
}

TEST(OptionsHeaderTest, OptionWithoutValueIsEmpty) {
  const auto header = ParseOptionsHeader("form-data; flag; name=x");
  EXPECT_EQ(header.option("flag"), "");
  EXPECT_EQ(header.option("name"), "x");
}

TEST(OptionsHeaderTest, LaterDuplicateWins) {
  const auto header = ParseOptionsHeader("text/plain; charset=ascii; charset=utf-8");
  ASSERT_EQ(header.options.size(), 1U);
  EXPECT_EQ(header.option("charset"), "utf-8");
}

TEST(OptionsHeaderTest, StopsSilentlyAtUnparseableFragment) {
  const auto header = ParseOptionsHeader("text/plain; a=1; =oops; b=2");
  EXPECT_EQ(header.value, "text/plain");
  EXPECT_EQ(header.option("a"), "1");
  EXPECT_FALSE(header.option("b").has_value());
}

}  // namespace conduit
