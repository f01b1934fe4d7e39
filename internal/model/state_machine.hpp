#pragma once

#include "modelreg/registry/v1/version.pb.h"

namespace modelreg::model {

using modelreg::registry::v1::VersionStatus;

/*
  Version lifecycle: ACTIVE -> DEPRECATED -> ARCHIVED, forward only.
  Production is an overlay and is only legal on non-archived records.
*/

constexpr int Rank(VersionStatus status) {
  switch (status) {
    case modelreg::registry::v1::VERSION_STATUS_ACTIVE:
      return 1;
    case modelreg::registry::v1::VERSION_STATUS_DEPRECATED:
      return 2;
    case modelreg::registry::v1::VERSION_STATUS_ARCHIVED:
      return 3;
    default:
      return 0;
  }
}

constexpr bool IsTerminal(VersionStatus status) {
  return status == modelreg::registry::v1::VERSION_STATUS_ARCHIVED;
}

constexpr bool CanTransition(VersionStatus from, VersionStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (Rank(to) == 0) {
    return false;
  }

  return Rank(to) > Rank(from);
}

constexpr bool CanHoldProduction(VersionStatus status) {
  return !IsTerminal(status);
}

} // namespace modelreg::model
