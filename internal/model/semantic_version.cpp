#include "semantic_version.hpp"

#include <charconv>
#include <limits>

#include "internal/util/errors.hpp"

namespace modelreg::model {

namespace {

uint32_t ParseComponent(std::string_view component, std::string_view full) {
  if (component.empty()) {
    throw util::InvalidVersionFormat("invalid version '" + std::string(full) + "': empty component");
  }
  for (char c : component) {
    if (c < '0' || c > '9') {
      throw util::InvalidVersionFormat("invalid version '" + std::string(full) + "': non-digit in component");
    }
  }

  uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(component.data(), component.data() + component.size(), value);
  if (ec != std::errc() || ptr != component.data() + component.size() || value > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidVersionFormat("invalid version '" + std::string(full) + "': component out of range");
  }
  return static_cast<uint32_t>(value);
}

} // namespace

SemanticVersion ParseVersion(std::string_view text) {
  const auto first = text.find('.');
  if (first == std::string_view::npos) {
    throw util::InvalidVersionFormat("invalid version '" + std::string(text) + "': expected MAJOR.MINOR.PATCH");
  }
  const auto second = text.find('.', first + 1);
  if (second == std::string_view::npos || text.find('.', second + 1) != std::string_view::npos) {
    throw util::InvalidVersionFormat("invalid version '" + std::string(text) + "': expected MAJOR.MINOR.PATCH");
  }

  SemanticVersion version;
  version.major = ParseComponent(text.substr(0, first), text);
  version.minor = ParseComponent(text.substr(first + 1, second - first - 1), text);
  version.patch = ParseComponent(text.substr(second + 1), text);
  return version;
}

std::string FormatVersion(const SemanticVersion& version) {
  return std::to_string(version.major) + "." + std::to_string(version.minor) + "." + std::to_string(version.patch);
}

int CompareVersions(std::string_view lhs, std::string_view rhs) {
  const auto a = ParseVersion(lhs);
  const auto b = ParseVersion(rhs);
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

} // namespace modelreg::model
