#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace modelreg::model {

/*
  MAJOR.MINOR.PATCH with ordering by lexicographic comparison of the triple.
*/
struct SemanticVersion {
  uint32_t major = 0;
  uint32_t minor = 0;
  uint32_t patch = 0;

  auto operator<=>(const SemanticVersion&) const = default;
};

// Throws util::InvalidVersionFormat unless `text` is exactly three
// non-negative decimal integers separated by dots.
SemanticVersion ParseVersion(std::string_view text);

std::string FormatVersion(const SemanticVersion& version);

// Negative, zero or positive as lhs <, ==, > rhs. Both must parse.
int CompareVersions(std::string_view lhs, std::string_view rhs);

} // namespace modelreg::model
