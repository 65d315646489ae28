#include "internal/pipeline/artifact_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace osforge::pipeline {

namespace fs = std::filesystem;

using osforge::model::ArtifactType;

namespace {

// rename(2) when possible; copy + remove across filesystems.
void MoveFile(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) {
    return;
  }
  fs::copy_file(from, to, fs::copy_options::overwrite_existing);
  fs::remove(from);
}

} // namespace

ArtifactRegistry::ArtifactRegistry(fs::path artifact_root) : artifact_root_(std::move(artifact_root)) {
}

std::vector<db::model::ArtifactRecord> ArtifactRegistry::Publish(const std::string& build_id, const std::vector<StagedArtifact>& staged) const {
  const auto target_dir = fs::absolute(artifact_root_ / build_id);

  std::vector<db::model::ArtifactRecord> out;
  out.reserve(staged.size());
  for (const auto& artifact : staged) {
    db::model::ArtifactRecord record;
    record.type      = artifact.type;
    record.file_name = artifact.file_name;
    record.url       = artifact.url;

    if (!artifact.source.empty()) {
      if (!fs::is_regular_file(artifact.source)) {
        throw std::runtime_error("staged artifact missing: " + artifact.source.string());
      }
      fs::create_directories(target_dir);
      const auto name = artifact.file_name.empty() ? artifact.source.filename().string() : artifact.file_name;
      const auto dest = target_dir / name;
      MoveFile(artifact.source, dest);
      record.file_name = name;
      record.url       = dest.string();
    }
    out.push_back(std::move(record));
  }
  return out;
}

std::vector<std::string> ArtifactRegistry::MissingRequiredTypes(const std::vector<db::model::ArtifactRecord>& artifacts) {
  auto has = [&](ArtifactType type) {
    return std::any_of(artifacts.begin(), artifacts.end(), [type](const auto& a) { return a.type == type; });
  };

  std::vector<std::string> missing;
  if (!has(ArtifactType::kIso)) {
    missing.emplace_back(osforge::model::ToString(ArtifactType::kIso));
  }
  if (!has(ArtifactType::kDockerImage) && !has(ArtifactType::kDockerImageRef)) {
    missing.emplace_back(osforge::model::ToString(ArtifactType::kDockerImage));
  }
  return missing;
}

} // namespace osforge::pipeline
