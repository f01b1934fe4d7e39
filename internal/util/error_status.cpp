#include "error_status.hpp"

#include <stdexcept>

namespace modelreg::util {

ExitCode ToExitCode(const std::exception& e) {
  if (dynamic_cast<const ModelNotFound*>(&e) || dynamic_cast<const VersionNotFound*>(&e) ||
      dynamic_cast<const NoProductionModel*>(&e)) {
    return ExitCode::kNotFound;
  }
  if (dynamic_cast<const InvalidVersionFormat*>(&e)) {
    return ExitCode::kInvalidVersion;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ExitCode::kInvalidState;
  }
  if (dynamic_cast<const RegistryBusy*>(&e)) {
    return ExitCode::kBusy;
  }
  if (dynamic_cast<const RegistryCorrupt*>(&e)) {
    return ExitCode::kCorrupt;
  }
  if (dynamic_cast<const ArtifactWriteFailed*>(&e) || dynamic_cast<const ArtifactDeleteFailed*>(&e)) {
    return ExitCode::kArtifactFailure;
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return ExitCode::kUsage;
  }

  return ExitCode::kInternal;
}

std::string_view ErrorName(const std::exception& e) {
  if (dynamic_cast<const RegistryCorrupt*>(&e)) return "RegistryCorrupt";
  if (dynamic_cast<const ModelNotFound*>(&e)) return "ModelNotFound";
  if (dynamic_cast<const VersionNotFound*>(&e)) return "VersionNotFound";
  if (dynamic_cast<const NoProductionModel*>(&e)) return "NoProductionModel";
  if (dynamic_cast<const InvalidVersionFormat*>(&e)) return "InvalidVersionFormat";
  if (dynamic_cast<const InvalidState*>(&e)) return "InvalidState";
  if (dynamic_cast<const ArtifactWriteFailed*>(&e)) return "ArtifactWriteFailed";
  if (dynamic_cast<const ArtifactDeleteFailed*>(&e)) return "ArtifactDeleteFailed";
  if (dynamic_cast<const RegistryBusy*>(&e)) return "RegistryBusy";
  if (dynamic_cast<const std::invalid_argument*>(&e)) return "InvalidArgument";
  return "Internal";
}

bool IsRequestError(const std::exception& e) {
  switch (ToExitCode(e)) {
    case ExitCode::kUsage:
    case ExitCode::kNotFound:
    case ExitCode::kInvalidState:
      return true;
    default:
      return false;
  }
}

} // namespace modelreg::util
