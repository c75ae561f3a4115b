#include "conduit/multipart-form-data.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "conduit/http-constants.hpp"
#include "conduit/options-header.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/string-trim.hpp"
#include "conduit/vector.hpp"

namespace conduit {
namespace {

constexpr std::string_view kDoubleDash{"--"};
constexpr std::string_view kMiddleBoundaryPrefix{"\r\n--"};

std::string_view AppendHeader(std::string_view line, const MultipartFormDataOptions& options, std::size_t headerCount,
                              vector<MultipartHeaderView>& headers) {
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    return "multipart part header missing colon";
  }
  const auto name = TrimOws(line.substr(0, colon));
  if (name.empty()) {
    return "multipart part header missing name";
  }
  if (options.maxHeadersPerPart != 0 && headerCount >= options.maxHeadersPerPart) {
    return "multipart part exceeds header limit";
  }
  headers.emplace_back(name, TrimOws(line.substr(colon + 1)));
  return {};
}

std::string_view HeaderValueOrEmpty(std::span<const MultipartHeaderView> headers, std::string_view key) noexcept {
  const auto it = std::ranges::find_if(
      headers, [key](const MultipartHeaderView& header) { return CaseInsensitiveEqual(header.name, key); });
  return it != headers.end() ? it->value : std::string_view{};
}

}  // namespace

const MultipartFormData::Part* MultipartFormData::part(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_parts, [name](const Part& part) { return part.name == name; });
  return it == _parts.end() ? nullptr : &*it;
}

MultipartFormData::MultipartFormData(std::string_view boundary, std::string_view body,
                                     MultipartFormDataOptions options) {
  if (boundary.empty()) {
    _invalidReason = "multipart/form-data boundary missing";
    return;
  }

  const auto matchBoundary = [this, boundary](std::string_view& remaining) {
    if (!remaining.starts_with(kDoubleDash) || !remaining.substr(kDoubleDash.size()).starts_with(boundary)) {
      _invalidReason = "multipart body missing starting boundary";
      return false;
    }
    remaining.remove_prefix(kDoubleDash.size() + boundary.size());
    return true;
  };

  if (!matchBoundary(body)) {
    return;
  }
  if (!body.starts_with(http::CRLF)) {
    _invalidReason = "multipart boundary not followed by CRLF";
    return;
  }
  body.remove_prefix(http::CRLF.size());

  while (true) {
    if (options.maxParts != 0 && _parts.size() >= options.maxParts) {
      _invalidReason = "multipart exceeds part limit";
      return;
    }

    std::string_view headerBlock;
    if (body.starts_with(http::CRLF)) {
      // part without headers
      body.remove_prefix(http::CRLF.size());
    } else {
      const auto headerEnd = body.find(http::DoubleCRLF);
      if (headerEnd == std::string_view::npos) {
        _invalidReason = "multipart part missing header terminator";
        return;
      }
      headerBlock = body.substr(0, headerEnd);
      body.remove_prefix(headerEnd + http::DoubleCRLF.size());
    }

    Part& part = _parts.emplace_back();
    part.headerOffset = _headers.size();

    std::size_t headerCountForPart = 0;
    while (!headerBlock.empty()) {
      const auto lineEnd = headerBlock.find(http::CRLF);
      const std::string_view line = headerBlock.substr(0, lineEnd);
      headerBlock = lineEnd == std::string_view::npos ? std::string_view{} : headerBlock.substr(lineEnd + 2U);
      if (line.empty()) {
        continue;
      }
      _invalidReason = AppendHeader(line, options, headerCountForPart, _headers);
      if (!_invalidReason.empty()) {
        return;
      }
      ++headerCountForPart;
    }
    part.headerCount = headerCountForPart;

    const auto partHeaders = headers(part);
    const std::string_view contentDisposition = HeaderValueOrEmpty(partHeaders, http::ContentDisposition);
    if (contentDisposition.empty()) {
      _invalidReason = "multipart part missing Content-Disposition header";
      return;
    }
    const OptionsHeader disposition = ParseOptionsHeader(contentDisposition);
    if (!CaseInsensitiveEqual(disposition.value, "form-data")) {
      _invalidReason = "multipart part must have Content-Disposition: form-data";
      return;
    }
    const auto name = disposition.option("name");
    if (!name || name->empty()) {
      _invalidReason = "multipart part missing name parameter";
      return;
    }
    part.name.assign(*name);
    if (const auto filename = disposition.option("filename")) {
      part.filename.emplace(*filename);
    }
    if (const auto contentType = HeaderValueOrEmpty(partHeaders, http::ContentType); !contentType.empty()) {
      part.contentType = contentType;
    }

    std::size_t boundaryPos = 0;
    while (true) {
      boundaryPos = body.find(kMiddleBoundaryPrefix, boundaryPos);
      if (boundaryPos == std::string_view::npos) {
        _invalidReason = "multipart part missing closing boundary";
        return;
      }
      if (body.substr(boundaryPos + kMiddleBoundaryPrefix.size()).starts_with(boundary)) {
        break;
      }
      boundaryPos += kMiddleBoundaryPrefix.size();
    }

    if (options.maxPartSizeBytes != 0 && boundaryPos > options.maxPartSizeBytes) {
      _invalidReason = "multipart part exceeds size limit";
      return;
    }
    part.value = body.substr(0, boundaryPos);
    body.remove_prefix(boundaryPos + http::CRLF.size());  // drop CRLF preceding boundary marker

    if (!matchBoundary(body)) {
      return;
    }

    const bool finalBoundary = body.starts_with(kDoubleDash);
    if (finalBoundary) {
      body.remove_prefix(kDoubleDash.size());
    }

    if (body.starts_with(http::CRLF)) {
      body.remove_prefix(http::CRLF.size());
    } else if (!body.empty() && !finalBoundary) {
      _invalidReason = "multipart boundary missing CRLF";
      return;
    }

    if (finalBoundary) {
      if (!body.empty()) {
        _invalidReason = "multipart data after final boundary";
      }
      return;
    }
  }
}

}  // namespace conduit
