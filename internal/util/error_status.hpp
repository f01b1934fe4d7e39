#pragma once

#include <exception>
#include <string_view>

#include "internal/util/errors.hpp"

namespace modelreg::util {

/*
  Converts internal exceptions into process exit codes and stable names.
*/

enum class ExitCode : int {
  kOk                = 0,
  kUsage             = 1,
  kInternal          = 2,
  kNotFound          = 3,
  kInvalidVersion    = 4,
  kInvalidState      = 5,
  kBusy              = 6,
  kCorrupt           = 7,
  kArtifactFailure   = 8,
};

ExitCode         ToExitCode(const std::exception& e);
std::string_view ErrorName(const std::exception& e);

// Failures caused by the request itself (missing model or version, bad
// arguments, forbidden transition) rather than by storage or internals.
bool IsRequestError(const std::exception& e);

} // namespace modelreg::util
