#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/build_record.hpp"

namespace osforge::pipeline {

// An output a stage produced but that is not yet published.
struct StagedArtifact {
  osforge::model::ArtifactType type = osforge::model::ArtifactType::kIso;
  // Local file to publish; empty for registry references.
  std::filesystem::path source;
  std::string           file_name;
  // Preset location for references (e.g. a registry tag).
  std::string url;
};

/*
  Typed outputs of a build.

  Publish moves staged files under <artifact_root>/<build_id>/ and turns them
  into records. The executor appends those records to the build; nothing is
  ever removed from a build once registered.
*/
class ArtifactRegistry {
 public:
  explicit ArtifactRegistry(std::filesystem::path artifact_root);

  std::vector<db::model::ArtifactRecord> Publish(const std::string& build_id, const std::vector<StagedArtifact>& staged) const;

  // Required types absent from artifacts: "iso" unless at least one ISO is
  // present, "docker-image" unless an image archive or reference is present.
  static std::vector<std::string> MissingRequiredTypes(const std::vector<db::model::ArtifactRecord>& artifacts);

  const std::filesystem::path& Root() const {
    return artifact_root_;
  }

 private:
  std::filesystem::path artifact_root_;
};

} // namespace osforge::pipeline
