#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/build_store.hpp"

namespace osforge::db::memory {

/*
  In-process build table.

  Two lock levels: index_mutex_ guards the id -> entry map (lookup/insert
  only), and each entry carries its own reader/writer lock for the record
  fields. Writers on one build never block readers of another.
*/
class MemoryBuildStore final : public BuildStore {
 public:
  using IdGenerator = std::function<std::string()>;

  MemoryBuildStore();
  explicit MemoryBuildStore(IdGenerator id_generator);

  std::string Create(const osforge::build::v1::BuildSpecification& spec) override;

  std::optional<model::BuildRecord> Get(const std::string& id) const override;
  LogSlice                          ReadLogs(const std::string& id, std::uint64_t offset) const override;
  std::vector<model::BuildSummary>  List() const override;
  StatusCounts                      CountByStatus() const override;

  void AppendLog(const std::string& id, const std::string& message) override;
  void AddArtifact(const std::string& id, const model::ArtifactRecord& artifact) override;
  void SetStatus(const std::string& id, osforge::model::BuildStatus status) override;

 private:
  struct Entry {
    mutable std::shared_mutex mutex;
    model::BuildRecord        record;
  };

  std::shared_ptr<Entry> Find(const std::string& id) const;
  std::shared_ptr<Entry> FindOrThrow(const std::string& id) const;

  IdGenerator                                             id_generator_;
  mutable std::shared_mutex                               index_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace osforge::db::memory
