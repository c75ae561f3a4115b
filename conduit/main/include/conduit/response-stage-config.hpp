#pragma once

namespace conduit {

struct ResponseStageConfig {
  // When set, the negotiated response is returned to the caller instead of being sent.
  // Default: false
  bool prepareResponseOnly{false};

  // When set, an HttpError escaping the inner chain becomes a text response with the error status and message.
  // Default: true
  bool convertHttpErrors{true};

  ResponseStageConfig& withPrepareResponseOnly(bool prepareOnly = true) {
    prepareResponseOnly = prepareOnly;
    return *this;
  }

  ResponseStageConfig& withConvertHttpErrors(bool convert = true) {
    convertHttpErrors = convert;
    return *this;
  }
};

}  // namespace conduit
