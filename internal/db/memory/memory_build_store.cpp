#include "memory_build_store.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace osforge::db::memory {

namespace {

constexpr int kMaxCreateAttempts = 8;

std::string DefaultId() {
  return util::ToString(util::GenerateUUID());
}

} // namespace

MemoryBuildStore::MemoryBuildStore() : MemoryBuildStore(DefaultId) {
}

MemoryBuildStore::MemoryBuildStore(IdGenerator id_generator) : id_generator_(std::move(id_generator)) {
}

std::string MemoryBuildStore::Create(const osforge::build::v1::BuildSpecification& spec) {
  auto entry               = std::make_shared<Entry>();
  entry->record.spec       = spec;
  entry->record.status     = osforge::model::BuildStatus::kPending;
  entry->record.created_at = util::Now();

  std::unique_lock lock(index_mutex_);
  for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
    auto id = id_generator_();
    if (entries_.contains(id)) {
      continue;
    }
    entry->record.id = id;
    entries_.emplace(id, std::move(entry));
    return id;
  }
  throw util::ResourceExhausted("unable to allocate a unique build id");
}

std::shared_ptr<MemoryBuildStore::Entry> MemoryBuildStore::Find(const std::string& id) const {
  std::shared_lock lock(index_mutex_);
  auto             it = entries_.find(id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<MemoryBuildStore::Entry> MemoryBuildStore::FindOrThrow(const std::string& id) const {
  auto entry = Find(id);
  if (!entry) {
    throw util::NotFound("build not found: " + id);
  }
  return entry;
}

std::optional<model::BuildRecord> MemoryBuildStore::Get(const std::string& id) const {
  auto entry = Find(id);
  if (!entry) {
    return std::nullopt;
  }
  std::shared_lock lock(entry->mutex);
  return entry->record;
}

LogSlice MemoryBuildStore::ReadLogs(const std::string& id, std::uint64_t offset) const {
  auto             entry = FindOrThrow(id);
  std::shared_lock lock(entry->mutex);

  LogSlice    slice;
  const auto& logs = entry->record.logs;
  slice.status     = entry->record.status;
  if (offset < logs.size()) {
    slice.entries.assign(logs.begin() + static_cast<std::ptrdiff_t>(offset), logs.end());
  }
  slice.next_offset = std::max<std::uint64_t>(offset, logs.size());
  return slice;
}

std::vector<model::BuildSummary> MemoryBuildStore::List() const {
  std::vector<std::shared_ptr<Entry>> snapshot;
  {
    std::shared_lock lock(index_mutex_);
    snapshot.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
      snapshot.push_back(entry);
    }
  }

  std::vector<model::BuildSummary> out;
  out.reserve(snapshot.size());
  for (const auto& entry : snapshot) {
    std::shared_lock lock(entry->mutex);
    out.push_back(model::BuildSummary{entry->record.id, entry->record.spec.name(), entry->record.status, entry->record.created_at});
  }
  return out;
}

StatusCounts MemoryBuildStore::CountByStatus() const {
  StatusCounts counts;
  for (const auto& summary : List()) {
    switch (summary.status) {
      case osforge::model::BuildStatus::kPending:
        ++counts.pending;
        break;
      case osforge::model::BuildStatus::kInProgress:
        ++counts.in_progress;
        break;
      case osforge::model::BuildStatus::kSuccess:
        ++counts.succeeded;
        break;
      case osforge::model::BuildStatus::kFailure:
        ++counts.failed;
        break;
    }
  }
  return counts;
}

void MemoryBuildStore::AppendLog(const std::string& id, const std::string& message) {
  auto             entry = FindOrThrow(id);
  std::unique_lock lock(entry->mutex);
  entry->record.logs.push_back(model::LogEntry{util::Now(), message});
}

void MemoryBuildStore::AddArtifact(const std::string& id, const model::ArtifactRecord& artifact) {
  auto             entry = FindOrThrow(id);
  std::unique_lock lock(entry->mutex);
  entry->record.artifacts.push_back(artifact);
}

void MemoryBuildStore::SetStatus(const std::string& id, osforge::model::BuildStatus status) {
  auto             entry = FindOrThrow(id);
  std::unique_lock lock(entry->mutex);

  const auto current = entry->record.status;
  if (!osforge::model::CanTransition(current, status)) {
    throw util::InvalidState("illegal status transition " + std::string(osforge::model::ToString(current)) + " -> " +
                             std::string(osforge::model::ToString(status)) + " for build " + id);
  }

  entry->record.status = status;
  if (osforge::model::IsTerminal(status)) {
    entry->record.completed_at = util::Now();
  }
}

} // namespace osforge::db::memory
