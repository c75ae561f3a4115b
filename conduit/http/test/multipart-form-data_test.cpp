#include "conduit/multipart-form-data.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <string_view>

namespace conduit {
namespace {

std::string BuildBody(std::initializer_list<std::string_view> segments) {
  std::string body;
  for (auto segment : segments) {
    body.append(segment);
  }
  return body;
}

void ExpectInvalid(const MultipartFormData& form, std::string_view invalidReason) {
  EXPECT_FALSE(form.valid());
  EXPECT_EQ(form.invalidReason(), invalidReason);
}

}  // namespace

TEST(MultipartFormDataTest, DefaultConstructorCreatesEmpty) {
  MultipartFormData form;
  EXPECT_TRUE(form.valid());
  EXPECT_TRUE(form.empty());
  EXPECT_TRUE(form.parts().empty());
}

TEST(MultipartFormDataTest, ParsesTextAndFileParts) {
  const std::string body = BuildBody({
      "--TestBoundary\r\n",
      "Content-Disposition: form-data; name=\"field1\"\r\n",
      "\r\n",
      "value-1\r\n",
      "--TestBoundary\r\n",
      "Content-Disposition: form-data; name=\"file\"; filename=\"hello.txt\"\r\n",
      "Content-Type: text/plain\r\n",
      "\r\n",
      "file-content\r\n",
      "--TestBoundary--\r\n",
  });

  MultipartFormData form("TestBoundary", body);
  ASSERT_TRUE(form.valid());
  ASSERT_EQ(form.parts().size(), 2U);

  const auto& textPart = form.parts()[0];
  EXPECT_EQ(textPart.name, "field1");
  EXPECT_FALSE(textPart.filename.has_value());
  EXPECT_FALSE(textPart.contentType.has_value());
  EXPECT_EQ(textPart.value, "value-1");

  const auto& filePart = form.parts()[1];
  EXPECT_EQ(filePart.name, "file");
  EXPECT_EQ(filePart.filename.value_or(std::string{}), "hello.txt");
  EXPECT_EQ(filePart.contentType.value_or(std::string_view{}), "text/plain");
  EXPECT_EQ(filePart.value, "file-content");

  const auto headers = form.headers(filePart);
  ASSERT_EQ(headers.size(), 2U);
  EXPECT_EQ(headers[1].name, "Content-Type");
  EXPECT_EQ(headers[1].value, "text/plain");
}

TEST(MultipartFormDataTest, ValueMayContainCRLF) {
  const std::string body = BuildBody({
      "--XYZ\r\n",
      "Content-Disposition: form-data; name=\"text\"\r\n",
      "\r\n",
      "line1\r\nline2\r\n--Bogus\r\n",
      "--XYZ--",
  });

  MultipartFormData form("XYZ", body);
  ASSERT_TRUE(form.valid());
  EXPECT_EQ(form.parts()[0].value, "line1\r\nline2\r\n--Bogus");
}

TEST(MultipartFormDataTest, LookupByName) {
  const std::string body = BuildBody({
      "--Aa--123\r\n",
      "Content-Disposition: form-data; name=\"alpha\"\r\n",
      "\r\n",
      "a\r\n",
      "--Aa--123--\r\n",
  });

  MultipartFormData form("Aa--123", body);
  ASSERT_TRUE(form.valid());
  const auto* first = form.part("alpha");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->value, "a");
  EXPECT_EQ(form.part("beta"), nullptr);
}

TEST(MultipartFormDataTest, FilenameStarParameterIsDecoded) {
  const std::string body = BuildBody({
      "--Utf8Boundary\r\n",
      "Content-Disposition: form-data; name=\"upload\"; filename*=utf-8''%E2%82%AC.bin\r\n",
      "\r\n",
      "payload\r\n",
      "--Utf8Boundary--\r\n",
  });

  MultipartFormData form("Utf8Boundary", body);
  ASSERT_TRUE(form.valid());
  EXPECT_EQ(form.parts()[0].filename.value_or(std::string{}), "\xE2\x82\xAC.bin");
}

TEST(MultipartFormDataTest, MissingBoundaryMakesFormInvalid) {
  MultipartFormData form("", "--x\r\n");
  ExpectInvalid(form, "multipart/form-data boundary missing");
}

TEST(MultipartFormDataTest, ExceedingPartLimit) {
  const std::string body = BuildBody({
      "--TestBoundary\r\n",
      "Content-Disposition: form-data; name=\"a\"\r\n",
      "\r\n",
      "1\r\n",
      "--TestBoundary\r\n",
      "Content-Disposition: form-data; name=\"b\"\r\n",
      "\r\n",
      "2\r\n",
      "--TestBoundary--\r\n",
  });

  MultipartFormDataOptions options;
  options.maxParts = 1;
  MultipartFormData form("TestBoundary", body, options);
  ExpectInvalid(form, "multipart exceeds part limit");
}

TEST(MultipartFormDataTest, MissingContentDispositionRejected) {
  const std::string body = BuildBody({
      "--TestBoundary\r\n",
      "X-Test: demo \r\n",
      "\r\n",
      "no header\r\n",
      "--TestBoundary--\r\n",
  });

  MultipartFormData form("TestBoundary", body);
  ExpectInvalid(form, "multipart part missing Content-Disposition header");
}

TEST(MultipartFormDataTest, ContentDispositionTypeMustBeFormData) {
  const std::string body = BuildBody({
      "--CDType\r\n",
      "Content-Disposition: attachment; name=\"field\"\r\n",
      "\r\n",
      "value\r\n",
      "--CDType--\r\n",
  });

  MultipartFormData form("CDType", body);
  ExpectInvalid(form, "multipart part must have Content-Disposition: form-data");
}

TEST(MultipartFormDataTest, ContentDispositionRequiresNameParameter) {
  const std::string body = BuildBody({
      "--CDName\r\n",
      "Content-Disposition: form-data; filename=\"f.txt\"\r\n",
      "\r\n",
      "value\r\n",
      "--CDName--\r\n",
  });

  MultipartFormData form("CDName", body);
  ExpectInvalid(form, "multipart part missing name parameter");
}

TEST(MultipartFormDataTest, StartingBoundaryMustExist) {
  MultipartFormData form("Start", "garbage");
  ExpectInvalid(form, "multipart body missing starting boundary");
}

TEST(MultipartFormDataTest, BoundaryMustBeFollowedByCRLF) {
  MultipartFormData form("NoCrlf", "--NoCrlf");
  ExpectInvalid(form, "multipart boundary not followed by CRLF");
}

TEST(MultipartFormDataTest, MissingHeaderTerminator) {
  MultipartFormData form("NoHeaderTerminator", "--NoHeaderTerminator\r\nContent-Disposition: form-data; name=\"f\"");
  ExpectInvalid(form, "multipart part missing header terminator");
}

TEST(MultipartFormDataTest, HeaderMustContainColon) {
  const std::string body = BuildBody({
      "--NoColon\r\n",
      "Content-Disposition form-data; name=\"field\"\r\n",
      "\r\n",
      "value\r\n",
      "--NoColon--\r\n",
  });

  MultipartFormData form("NoColon", body);
  ExpectInvalid(form, "multipart part header missing colon");
}

TEST(MultipartFormDataTest, HeaderLimitIsEnforced) {
  const std::string body = BuildBody({
      "--HeaderLimit\r\n",
      "Content-Disposition: form-data; name=\"a\"\r\n",
      "Content-Type: text/plain\r\n",
      "\r\n",
      "v\r\n",
      "--HeaderLimit--\r\n",
  });

  MultipartFormDataOptions options;
  options.maxHeadersPerPart = 1;
  MultipartFormData form("HeaderLimit", body, options);
  ExpectInvalid(form, "multipart part exceeds header limit");
}

TEST(MultipartFormDataTest, MissingClosingBoundary) {
  const std::string body = BuildBody({
      "--NoClosing\r\n",
      "Content-Disposition: form-data; name=\"field\"\r\n",
      "\r\n",
      "value",
  });

  MultipartFormData form("NoClosing", body);
  ExpectInvalid(form, "multipart part missing closing boundary");
}

TEST(MultipartFormDataTest, PartSizeLimitIsHonored) {
  const std::string body = BuildBody({
      "--PartLimit\r\n",
      "Content-Disposition: form-data; name=\"field\"\r\n",
      "\r\n",
      "oversize\r\n",
      "--PartLimit--\r\n",
  });

  MultipartFormDataOptions options;
  options.maxPartSizeBytes = 4;
  MultipartFormData form("PartLimit", body, options);
  ExpectInvalid(form, "multipart part exceeds size limit");
}

TEST(MultipartFormDataTest, BoundaryRequiresTrailingCRLFForNextPart) {
  const std::string body = BuildBody({
      "--Multi\r\n",
      "Content-Disposition: form-data; name=\"first\"\r\n",
      "\r\n",
      "1\r\n",
      "--Multi",
      "Content-Disposition: form-data; name=\"second\"\r\n",
      "\r\n",
      "2\r\n",
      "--Multi--\r\n",
  });

  MultipartFormData form("Multi", body);
  ExpectInvalid(form, "multipart boundary missing CRLF");
}

TEST(MultipartFormDataTest, DataAfterFinalBoundary) {
  const std::string body = BuildBody({
      "--End\r\n",
      "Content-Disposition: form-data; name=\"a\"\r\n",
      "\r\n",
      "1\r\n",
      "--End--\r\n",
      "trailing",
  });

  MultipartFormData form("End", body);
  ExpectInvalid(form, "multipart data after final boundary");
}

}  // namespace conduit
