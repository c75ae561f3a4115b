#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "conduit/vector.hpp"

namespace conduit {

struct MultipartFormDataOptions {
  std::size_t maxParts{128};
  std::size_t maxHeadersPerPart{32};
  std::size_t maxPartSizeBytes{32ULL * 1024ULL * 1024ULL};
};

struct MultipartHeaderView {
  std::string_view name;
  std::string_view value;
};

// Minimal multipart/form-data parser. Views point into the parsed body, which must outlive this object.
class MultipartFormData {
 public:
  struct Part {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string_view> contentType;
    std::string_view value;

   private:
    friend class MultipartFormData;

    std::size_t headerOffset{0};
    std::size_t headerCount{0};
  };

  MultipartFormData() noexcept = default;

  // Parse 'body' delimited by 'boundary' without throwing on malformed input, check valid() afterwards.
  MultipartFormData(std::string_view boundary, std::string_view body, MultipartFormDataOptions options = {});

  [[nodiscard]] std::span<const Part> parts() const noexcept { return _parts; }

  [[nodiscard]] bool empty() const noexcept { return _parts.empty(); }

  // Headers of given part.
  [[nodiscard]] std::span<const MultipartHeaderView> headers(const Part& part) const noexcept {
    return std::span<const MultipartHeaderView>(_headers).subspan(part.headerOffset, part.headerCount);
  }

  // First part named 'name', or nullptr.
  [[nodiscard]] const Part* part(std::string_view name) const noexcept;

  [[nodiscard]] bool valid() const noexcept { return _invalidReason.empty(); }

  // If not valid(), the reason of the failure.
  [[nodiscard]] std::string_view invalidReason() const noexcept { return _invalidReason; }

 private:
  vector<Part> _parts;
  vector<MultipartHeaderView> _headers;
  std::string_view _invalidReason;  // empty if valid
};

}  // namespace conduit
