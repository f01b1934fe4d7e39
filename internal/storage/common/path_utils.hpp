#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace modelreg::storage::common {

// Model names and versions become directory names; reject anything that could
// escape the artifact root.
inline void ValidatePathComponent(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline void ValidateModelName(const std::string& model_name) {
  ValidatePathComponent(model_name, "model name");
}

inline std::filesystem::path VersionDir(const std::filesystem::path& root, const std::string& model_name, const std::string& version) {
  ValidatePathComponent(model_name, "model name");
  ValidatePathComponent(version, "version");
  return root / model_name / version;
}

inline constexpr const char* kArtifactFileName = "model.bin";
inline constexpr const char* kSidecarFileName  = "metadata.json";

// Locator stored in VersionRecord.artifact_locator: "<model>/<version>/model.bin".
inline std::string ArtifactLocator(const std::string& model_name, const std::string& version) {
  ValidatePathComponent(model_name, "model name");
  ValidatePathComponent(version, "version");
  return model_name + "/" + version + "/" + kArtifactFileName;
}

inline std::filesystem::path ResolveLocator(const std::filesystem::path& root, const std::string& locator) {
  const std::filesystem::path relative(locator);
  if (locator.empty() || relative.is_absolute()) {
    throw std::invalid_argument("artifact locator must be a non-empty relative path");
  }
  for (const auto& part : relative) {
    if (part == "..") {
      throw std::invalid_argument("artifact locator must not leave the artifact root");
    }
  }
  return root / relative;
}

} // namespace modelreg::storage::common
