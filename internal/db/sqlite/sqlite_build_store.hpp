#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/build_store.hpp"
#include "sqlite_db.hpp"

namespace osforge::db::sqlite {

/*
  Durable BuildStore on a single sqlite connection.

  Schema:
    builds(id, name, spec_json, status, created_at_ms, completed_at_ms)
    build_logs(build_id, seq, created_at_ms, message)
    build_artifacts(build_id, seq, file_type, file_name, url)

  Mutations are serialized on the write connection, each in its own
  transaction. Queries run on pooled read-only connections and never wait
  for a writer, so polling one build is not held up by another build's log
  appends.
*/
class SqliteBuildStore final : public BuildStore {
 public:
  using IdGenerator = std::function<std::string()>;

  explicit SqliteBuildStore(std::shared_ptr<SqliteDB> db);
  SqliteBuildStore(std::shared_ptr<SqliteDB> db, IdGenerator id_generator);

  std::string Create(const osforge::build::v1::BuildSpecification& spec) override;

  std::optional<model::BuildRecord> Get(const std::string& id) const override;
  LogSlice                          ReadLogs(const std::string& id, std::uint64_t offset) const override;
  std::vector<model::BuildSummary>  List() const override;
  StatusCounts                      CountByStatus() const override;

  void AppendLog(const std::string& id, const std::string& message) override;
  void AddArtifact(const std::string& id, const model::ArtifactRecord& artifact) override;
  void SetStatus(const std::string& id, osforge::model::BuildStatus status) override;

 private:
  void Migrate();

  std::shared_ptr<SqliteDB> db_;
  IdGenerator               id_generator_;
};

} // namespace osforge::db::sqlite
