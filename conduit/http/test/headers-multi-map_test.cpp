#include "conduit/headers-multi-map.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "conduit/raw-header.hpp"
#include "conduit/vector.hpp"

namespace conduit {

TEST(HeadersMultiMapTest, EmptyByDefault) {
  HeadersMultiMap headers;
  EXPECT_TRUE(headers.empty());
  EXPECT_EQ(headers.size(), 0U);
  EXPECT_FALSE(headers.get("host").has_value());
  EXPECT_TRUE(headers.getOrEmpty("host").empty());
  EXPECT_TRUE(headers.getAll("host").empty());
}

TEST(HeadersMultiMapTest, LookupsIgnoreCase) {
  HeadersMultiMap headers;
  headers.append("Content-Type", "text/plain");
  EXPECT_TRUE(headers.contains("content-type"));
  EXPECT_EQ(headers.getOrEmpty("CONTENT-TYPE"), "text/plain");
}

TEST(HeadersMultiMapTest, DuplicatesKeepArrivalOrder) {
  const vector<RawHeader> raw{{"cookie", "a=1"}, {"host", "example.com"}, {"Cookie", "b=2"}};
  const auto headers = HeadersMultiMap::FromRaw(raw);
  EXPECT_EQ(headers.size(), 3U);
  EXPECT_EQ(headers.count("cookie"), 2U);
  EXPECT_EQ(headers.getOrEmpty("cookie"), "a=1");

  const auto all = headers.getAll("cookie");
  ASSERT_EQ(all.size(), 2U);
  EXPECT_EQ(all[0], "a=1");
  EXPECT_EQ(all[1], "b=2");

  auto it = headers.begin();
  EXPECT_EQ(it->name, "cookie");
  ++it;
  EXPECT_EQ(it->name, "host");
}

TEST(HeadersMultiMapTest, RawBytesAreReadAsLatin1) {
  const vector<RawHeader> raw{{"x-name", "caf\xE9"}};
  const auto headers = HeadersMultiMap::FromRaw(raw);
  EXPECT_EQ(headers.getOrEmpty("x-name"), "caf\xC3\xA9");
}

}  // namespace conduit
