#include "version_allocator.hpp"

#include <limits>
#include <stdexcept>

#include "internal/model/semantic_version.hpp"
#include "internal/util/errors.hpp"

namespace modelreg::core {

using namespace modelreg::registry::v1;
using modelreg::model::FormatVersion;
using modelreg::model::ParseVersion;
using modelreg::model::SemanticVersion;

namespace {

uint32_t Increment(uint32_t component, const SemanticVersion& latest) {
  if (component == std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidVersionFormat("cannot bump version " + FormatVersion(latest) + ": component would overflow");
  }
  return component + 1;
}

} // namespace

BumpKind ParseBumpKind(std::string_view text) {
  if (text == "patch") return BUMP_KIND_PATCH;
  if (text == "minor") return BUMP_KIND_MINOR;
  if (text == "major") return BUMP_KIND_MAJOR;
  throw std::invalid_argument("unsupported bump kind '" + std::string(text) + "'; expected major, minor or patch");
}

std::string VersionAllocator::NextVersion(const ModelLine& line, BumpKind bump) {
  if (line.versions().empty()) {
    return "1.0.0";
  }

  const auto latest = ParseVersion(line.versions(line.versions_size() - 1).version());
  switch (bump) {
    case BUMP_KIND_MAJOR:
      return FormatVersion({Increment(latest.major, latest), 0, 0});
    case BUMP_KIND_MINOR:
      return FormatVersion({latest.major, Increment(latest.minor, latest), 0});
    case BUMP_KIND_PATCH:
    default:
      return FormatVersion({latest.major, latest.minor, Increment(latest.patch, latest)});
  }
}

} // namespace modelreg::core
