#pragma once

#include <string>
#include <string_view>

#include "modelreg/registry/v1/registry.pb.h"
#include "modelreg/registry/v1/version.pb.h"

namespace modelreg::core {

// "major" | "minor" | "patch"; throws std::invalid_argument otherwise.
modelreg::registry::v1::BumpKind ParseBumpKind(std::string_view text);

/*
  Computes the next version for a model line.

  Pure function of the line: empty -> 1.0.0, otherwise the latest record's
  version bumped by `bump` (UNSPECIFIED behaves as PATCH). Throws
  util::InvalidVersionFormat when the latest version does not parse.
*/
class VersionAllocator {
 public:
  static std::string NextVersion(const modelreg::registry::v1::ModelLine& line, modelreg::registry::v1::BumpKind bump);
};

} // namespace modelreg::core
