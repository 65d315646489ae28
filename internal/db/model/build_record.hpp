#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/build_status.hpp"
#include "internal/util/time.hpp"
#include "osforge/build/v1.hpp"

namespace osforge::db::model {

struct LogEntry {
  util::TimePoint created_at;
  std::string     message;
};

struct ArtifactRecord {
  osforge::model::ArtifactType type = osforge::model::ArtifactType::kIso;
  std::string                  file_name;
  std::string                  url;
};

/*
  Authoritative build row.

  IMPORTANT:
  - id and spec never change after Create.
  - status only moves along osforge::model::CanTransition.
  - logs and artifacts are append-only; readers may see a prefix.
*/
struct BuildRecord {
  std::string id;

  osforge::build::v1::BuildSpecification spec;

  osforge::model::BuildStatus status = osforge::model::BuildStatus::kPending;

  std::vector<LogEntry>       logs;
  std::vector<ArtifactRecord> artifacts;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> completed_at;
};

// Lightweight row for listings.
struct BuildSummary {
  std::string                 id;
  std::string                 name;
  osforge::model::BuildStatus status = osforge::model::BuildStatus::kPending;
  util::TimePoint             created_at;
};

} // namespace osforge::db::model
