#pragma once

namespace glancelab::core::errors {

// Stable process-exit contract for scripted experiment pipelines.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values split "you asked for something we do not know" from
// "the data you gave us is malformed" so wrappers can branch on the class of
// failure without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kInputInvalid = 11,
  kAdoptionRejected = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace glancelab::core::errors
