#include "conduit/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>

namespace conduit::url {

TEST(UrlDecode, DecodesPercentSequences) {
  EXPECT_EQ(Decode("a%20b%2Fc"), "a b/c");
  EXPECT_EQ(Decode("%e2%82%AC"), "\xE2\x82\xAC");
}

TEST(UrlDecode, PlusHandling) {
  EXPECT_EQ(Decode("a+b"), "a+b");
  EXPECT_EQ(Decode("a+b", ' '), "a b");
}

TEST(UrlDecode, StrictRejectsInvalidSequences) {
  EXPECT_FALSE(Decode("abc%"));
  EXPECT_FALSE(Decode("abc%2"));
  EXPECT_FALSE(Decode("%zz"));
}

TEST(UrlDecode, LenientKeepsInvalidSequences) {
  EXPECT_EQ(Decode("abc%", '+', false), "abc%");
  EXPECT_EQ(Decode("100%zz", '+', false), "100%zz");
  EXPECT_EQ(Decode("%%41", '+', false), "%A");
}

TEST(UrlDecode, InPlaceReturnsNewEnd) {
  std::string buf = "x%41y";
  char* newEnd = DecodeInPlace(buf.data(), buf.data() + buf.size());
  ASSERT_NE(newEnd, nullptr);
  EXPECT_EQ(std::string(buf.data(), newEnd), "xAy");
}

}  // namespace conduit::url
