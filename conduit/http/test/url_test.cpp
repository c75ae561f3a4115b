#include "conduit/url.hpp"

#include <gtest/gtest.h>

#include "conduit/connection-scope.hpp"
#include "conduit/headers-multi-map.hpp"
#include "conduit/scope-type.hpp"

namespace conduit {
namespace {

Url BuildUrl(ConnectionScopeBuilder& builder) {
  const auto scope = builder.build();
  return Url::FromScope(*scope, HeadersMultiMap::FromRaw(scope->headers()));
}

}  // namespace

TEST(UrlTest, DefaultPortDependsOnScheme) {
  EXPECT_EQ(DefaultPort("http"), 80);
  EXPECT_EQ(DefaultPort("ws"), 80);
  EXPECT_EQ(DefaultPort("HTTPS"), 443);
  EXPECT_EQ(DefaultPort("wss"), 443);
  EXPECT_FALSE(DefaultPort("ftp").has_value());
}

TEST(UrlTest, HostHeaderWithoutPortUsesServerPort) {
  ConnectionScopeBuilder builder;
  builder.withPath("/items").withQueryString("a=1").withServer("10.0.0.1", 8080).withHeader("host", "example.com");
  const Url url = BuildUrl(builder);
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.host, "example.com");
  EXPECT_EQ(url.port, 8080);
  EXPECT_EQ(url.path, "/items");
  EXPECT_EQ(url.query, "a=1");
  EXPECT_EQ(url.str(), "http://example.com:8080/items?a=1");
}

TEST(UrlTest, HostHeaderPortWins) {
  ConnectionScopeBuilder builder;
  builder.withServer("10.0.0.1", 8080).withHeader("Host", "example.com:9000");
  const Url url = BuildUrl(builder);
  EXPECT_EQ(url.host, "example.com");
  EXPECT_EQ(url.port, 9000);
}

TEST(UrlTest, FallsBackToServerAddress) {
  ConnectionScopeBuilder builder;
  builder.withScheme("https").withServer("localhost", 443).withRootPath("/api").withPath("/users");
  const Url url = BuildUrl(builder);
  EXPECT_EQ(url.host, "localhost");
  EXPECT_TRUE(url.hasDefaultPort());
  EXPECT_EQ(url.path, "/api/users");
  EXPECT_EQ(url.str(), "https://localhost/api/users");
}

TEST(UrlTest, Ipv6HostHeader) {
  ConnectionScopeBuilder builder;
  builder.withHeader("host", "[::1]:8443");
  const Url url = BuildUrl(builder);
  EXPECT_EQ(url.host, "[::1]");
  EXPECT_EQ(url.port, 8443);
}

TEST(UrlTest, NoHostInformation) {
  ConnectionScopeBuilder builder;
  builder.withPath("/");
  const Url url = BuildUrl(builder);
  EXPECT_TRUE(url.host.empty());
  EXPECT_FALSE(url.port.has_value());
  EXPECT_EQ(url.str(), "http:///");
}

TEST(UrlTest, QueryBytesAreReadAsLatin1) {
  ConnectionScopeBuilder builder;
  builder.withQueryString("q=\xE9");
  const Url url = BuildUrl(builder);
  EXPECT_EQ(url.query, "q=\xC3\xA9");
}

}  // namespace conduit
