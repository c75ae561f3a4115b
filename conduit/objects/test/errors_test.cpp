#include "conduit/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "conduit/http-status-code.hpp"

namespace conduit {

TEST(ErrorsTest, DecodeErrorMessages) {
  EXPECT_STREQ(DecodeError(DecodeTarget::Text).what(), "Invalid Encoding");
  EXPECT_STREQ(DecodeError(DecodeTarget::Json).what(), "Invalid JSON");
  EXPECT_STREQ(DecodeError(DecodeTarget::Form).what(), "Invalid Form Data");
}

TEST(ErrorsTest, DecodeErrorIsBadRequest) {
  DecodeError err(DecodeTarget::Json);
  EXPECT_EQ(err.status(), http::StatusCodeBadRequest);
  EXPECT_EQ(err.target(), DecodeTarget::Json);
  const HttpError& base = err;
  EXPECT_EQ(base.status(), http::StatusCodeBadRequest);
}

TEST(ErrorsTest, RouteErrors) {
  RouteNotFound notFound("/missing");
  EXPECT_EQ(notFound.status(), http::StatusCodeNotFound);
  EXPECT_NE(std::string_view(notFound.what()).find("/missing"), std::string_view::npos);

  MethodNotAllowed notAllowed("PUT", "/items");
  EXPECT_EQ(notAllowed.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_THROW(throw notAllowed, RouteNotFound);
}

TEST(ErrorsTest, Hierarchy) {
  EXPECT_THROW(throw ConfigurationError("bad"), std::invalid_argument);
  EXPECT_THROW(throw MissingReceiveError(), std::logic_error);
  EXPECT_THROW(throw DecodeError(DecodeTarget::Form), std::runtime_error);
}

}  // namespace conduit
