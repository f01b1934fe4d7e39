#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

#include "modelreg/registry/v1/version.pb.h"

namespace modelreg::storage {

/*
  Artifact storage abstraction.

  Every artifact is an opaque Arrow Buffer addressed by (model name, version).
  The registry never inspects artifact content.

  Implementations:
    DISK     → Arrow file IO under <artifact root>/<model>/<version>/
    MEMORY   → in-process buffers (tests, ephemeral registries)
*/

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist artifact bytes for a version and return the locator recorded in
    VersionRecord.artifact_locator.

    Throws util::ArtifactWriteFailed; nothing is left behind on failure.
  */
  virtual std::string Write(const std::string& model_name, const std::string& version, const std::shared_ptr<arrow::Buffer>& bytes) = 0;

  // ------------------------------------------------------------------
  // Sidecar
  // ------------------------------------------------------------------
  /*
    Human-readable mirror of the record, stored next to the artifact.
    Throws util::ArtifactWriteFailed.
  */
  virtual void WriteSidecar(const modelreg::registry::v1::VersionRecord& record) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& locator) = 0;

  virtual bool Exists(const std::string& locator) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  /*
    Remove the artifact and its sidecar. Removing something already gone is
    not an error. Throws util::ArtifactDeleteFailed.
  */
  virtual void Remove(const std::string& model_name, const std::string& version) = 0;

  virtual std::string Kind() const = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace modelreg::storage
