#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/build_record.hpp"

namespace osforge::db {

struct LogSlice {
  osforge::model::BuildStatus  status = osforge::model::BuildStatus::kPending;
  std::vector<model::LogEntry> entries;
  std::uint64_t                next_offset = 0;
};

struct StatusCounts {
  std::uint64_t pending     = 0;
  std::uint64_t in_progress = 0;
  std::uint64_t succeeded   = 0;
  std::uint64_t failed      = 0;
};

/*
  Storage abstraction for build records.

  Mutators throw util::NotFound for an unknown id and util::InvalidState for
  an illegal status transition. Readers get a consistent snapshot of a single
  record; concurrent appends never reorder or retract entries.
*/
class BuildStore {
 public:
  virtual ~BuildStore() = default;

  // Inserts a PENDING record under a fresh v4 UUID and returns the id.
  virtual std::string Create(const osforge::build::v1::BuildSpecification& spec) = 0;

  virtual std::optional<model::BuildRecord> Get(const std::string& id) const = 0;

  // Entries at index >= offset, plus the status observed with them.
  virtual LogSlice ReadLogs(const std::string& id, std::uint64_t offset) const = 0;

  virtual std::vector<model::BuildSummary> List() const = 0;

  virtual StatusCounts CountByStatus() const = 0;

  virtual void AppendLog(const std::string& id, const std::string& message) = 0;

  virtual void AddArtifact(const std::string& id, const model::ArtifactRecord& artifact) = 0;

  // Entering SUCCESS or FAILURE stamps completed_at.
  virtual void SetStatus(const std::string& id, osforge::model::BuildStatus status) = 0;
};

} // namespace osforge::db
