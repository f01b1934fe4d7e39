#pragma once

#include <stdexcept>
#include <string>

namespace modelreg::util {

/*
  Central error types.

  Every public registry operation either returns a value or throws exactly one
  of these. The CLI translates them to exit codes (see error_status.hpp).
*/

// Registry document unreadable or malformed. Never auto-repaired.
class RegistryCorrupt : public std::runtime_error {
 public:
  explicit RegistryCorrupt(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ModelNotFound : public std::runtime_error {
 public:
  explicit ModelNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class VersionNotFound : public std::runtime_error {
 public:
  explicit VersionNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoProductionModel : public std::runtime_error {
 public:
  explicit NoProductionModel(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidVersionFormat : public std::runtime_error {
 public:
  explicit InvalidVersionFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactWriteFailed : public std::runtime_error {
 public:
  explicit ArtifactWriteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Per-record during cleanup: logged and skipped, never fatal to the pass.
class ArtifactDeleteFailed : public std::runtime_error {
 public:
  explicit ArtifactDeleteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lock wait timed out. Retryable by the caller.
class RegistryBusy : public std::runtime_error {
 public:
  explicit RegistryBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace modelreg::util
