#include "sqlite_build_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace osforge::db::sqlite {

using osforge::model::BuildStatus;

namespace {

constexpr int kMaxCreateAttempts = 8;

std::string DefaultId() {
  return util::ToString(util::GenerateUUID());
}

std::int64_t NowMs() {
  return static_cast<std::int64_t>(util::ToUnixMillis(util::Now()));
}

BuildStatus StatusFromColumn(std::int64_t value) {
  switch (value) {
    case 1:
      return BuildStatus::kPending;
    case 2:
      return BuildStatus::kInProgress;
    case 3:
      return BuildStatus::kSuccess;
    case 4:
      return BuildStatus::kFailure;
    default:
      throw std::runtime_error("corrupt build status column: " + std::to_string(value));
  }
}

std::optional<BuildStatus> LoadStatus(sqlite3* db, const std::string& id) {
  auto stmt = PrepareOn(db, "SELECT status FROM builds WHERE id=?;");
  BindText(stmt.get(), 1, id);
  int rc = sqlite3_step(stmt.get());
  CheckOn(db, rc, "select build status");
  if (rc != SQLITE_ROW) {
    return std::nullopt;
  }
  return StatusFromColumn(ColumnInt64(stmt.get(), 0));
}

BuildStatus RequireStatus(sqlite3* db, const std::string& id) {
  auto status = LoadStatus(db, id);
  if (!status) {
    throw util::NotFound("build not found: " + id);
  }
  return *status;
}

} // namespace

SqliteBuildStore::SqliteBuildStore(std::shared_ptr<SqliteDB> db) : SqliteBuildStore(std::move(db), DefaultId) {
}

SqliteBuildStore::SqliteBuildStore(std::shared_ptr<SqliteDB> db, IdGenerator id_generator)
    : db_(std::move(db)), id_generator_(std::move(id_generator)) {
  Migrate();
}

void SqliteBuildStore::Migrate() {
  std::lock_guard lock(db_->WriteLock());
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS builds ("
      "  id TEXT PRIMARY KEY,"
      "  name TEXT NOT NULL DEFAULT '',"
      "  spec_json TEXT NOT NULL,"
      "  status INTEGER NOT NULL,"
      "  created_at_ms INTEGER NOT NULL,"
      "  completed_at_ms INTEGER"
      ");"
      "CREATE TABLE IF NOT EXISTS build_logs ("
      "  build_id TEXT NOT NULL REFERENCES builds(id) ON DELETE CASCADE,"
      "  seq INTEGER NOT NULL,"
      "  created_at_ms INTEGER NOT NULL,"
      "  message TEXT NOT NULL,"
      "  PRIMARY KEY (build_id, seq)"
      ");"
      "CREATE TABLE IF NOT EXISTS build_artifacts ("
      "  build_id TEXT NOT NULL REFERENCES builds(id) ON DELETE CASCADE,"
      "  seq INTEGER NOT NULL,"
      "  file_type TEXT NOT NULL,"
      "  file_name TEXT NOT NULL,"
      "  url TEXT NOT NULL,"
      "  PRIMARY KEY (build_id, seq)"
      ");");
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

std::string SqliteBuildStore::Create(const osforge::build::v1::BuildSpecification& spec) {
  std::string spec_json;
  auto        json_status = google::protobuf::util::MessageToJsonString(spec, &spec_json);
  if (!json_status.ok()) {
    throw std::runtime_error("failed to encode build specification: " + std::string(json_status.message()));
  }

  std::lock_guard lock(db_->WriteLock());
  Transaction     tx(*db_);

  auto insert = db_->Prepare(
      "INSERT OR IGNORE INTO builds(id,name,spec_json,status,created_at_ms,completed_at_ms) "
      "VALUES(?,?,?,?,?,NULL);");

  for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
    auto id = id_generator_();

    sqlite3_reset(insert.get());
    BindText(insert.get(), 1, id);
    BindText(insert.get(), 2, spec.name());
    BindText(insert.get(), 3, spec_json);
    BindInt64(insert.get(), 4, static_cast<std::int64_t>(BuildStatus::kPending));
    BindInt64(insert.get(), 5, NowMs());
    db_->Check(sqlite3_step(insert.get()), "insert build");

    if (sqlite3_changes(db_->Handle()) == 1) {
      tx.Commit();
      return id;
    }
  }
  throw util::ResourceExhausted("unable to allocate a unique build id");
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::BuildRecord> SqliteBuildStore::Get(const std::string& id) const {
  auto         conn = db_->Reader();
  ReadSnapshot snapshot(conn);

  auto stmt = conn.Prepare("SELECT spec_json,status,created_at_ms,completed_at_ms FROM builds WHERE id=?;");
  BindText(stmt.get(), 1, id);
  int rc = sqlite3_step(stmt.get());
  conn.Check(rc, "select build");
  if (rc != SQLITE_ROW) {
    return std::nullopt;
  }

  model::BuildRecord record;
  record.id = id;

  auto parsed = google::protobuf::util::JsonStringToMessage(ColumnText(stmt.get(), 0), &record.spec);
  if (!parsed.ok()) {
    throw std::runtime_error("corrupt spec_json for build " + id + ": " + std::string(parsed.message()));
  }
  record.status     = StatusFromColumn(ColumnInt64(stmt.get(), 1));
  record.created_at = util::FromUnixMillis(static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 2)));
  if (!ColumnIsNull(stmt.get(), 3)) {
    record.completed_at = util::FromUnixMillis(static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 3)));
  }

  auto logs = conn.Prepare("SELECT created_at_ms,message FROM build_logs WHERE build_id=? ORDER BY seq;");
  BindText(logs.get(), 1, id);
  while ((rc = sqlite3_step(logs.get())) == SQLITE_ROW) {
    record.logs.push_back(model::LogEntry{util::FromUnixMillis(static_cast<std::uint64_t>(ColumnInt64(logs.get(), 0))), ColumnText(logs.get(), 1)});
  }
  conn.Check(rc, "select build logs");

  auto artifacts = conn.Prepare("SELECT file_type,file_name,url FROM build_artifacts WHERE build_id=? ORDER BY seq;");
  BindText(artifacts.get(), 1, id);
  while ((rc = sqlite3_step(artifacts.get())) == SQLITE_ROW) {
    auto type = osforge::model::ArtifactTypeFromString(ColumnText(artifacts.get(), 0));
    if (!type) {
      throw std::runtime_error("corrupt artifact type for build " + id);
    }
    record.artifacts.push_back(model::ArtifactRecord{*type, ColumnText(artifacts.get(), 1), ColumnText(artifacts.get(), 2)});
  }
  conn.Check(rc, "select build artifacts");

  return record;
}

LogSlice SqliteBuildStore::ReadLogs(const std::string& id, std::uint64_t offset) const {
  auto         conn = db_->Reader();
  ReadSnapshot snapshot(conn);

  LogSlice slice;
  slice.status      = RequireStatus(conn.Handle(), id);
  slice.next_offset = offset;

  auto stmt = conn.Prepare("SELECT seq,created_at_ms,message FROM build_logs WHERE build_id=? AND seq>=? ORDER BY seq;");
  BindText(stmt.get(), 1, id);
  BindInt64(stmt.get(), 2, static_cast<std::int64_t>(offset));

  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    slice.entries.push_back(model::LogEntry{util::FromUnixMillis(static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 1))), ColumnText(stmt.get(), 2)});
    slice.next_offset = static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 0)) + 1;
  }
  conn.Check(rc, "select build logs");
  return slice;
}

std::vector<model::BuildSummary> SqliteBuildStore::List() const {
  auto conn = db_->Reader();

  auto stmt = conn.Prepare("SELECT id,name,status,created_at_ms FROM builds ORDER BY created_at_ms;");

  std::vector<model::BuildSummary> out;
  int                              rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    out.push_back(model::BuildSummary{ColumnText(stmt.get(), 0), ColumnText(stmt.get(), 1), StatusFromColumn(ColumnInt64(stmt.get(), 2)),
                                      util::FromUnixMillis(static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 3)))});
  }
  conn.Check(rc, "list builds");
  return out;
}

StatusCounts SqliteBuildStore::CountByStatus() const {
  auto conn = db_->Reader();

  auto stmt = conn.Prepare("SELECT status,COUNT(*) FROM builds GROUP BY status;");

  StatusCounts counts;
  int          rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    const auto n = static_cast<std::uint64_t>(ColumnInt64(stmt.get(), 1));
    switch (StatusFromColumn(ColumnInt64(stmt.get(), 0))) {
      case BuildStatus::kPending:
        counts.pending = n;
        break;
      case BuildStatus::kInProgress:
        counts.in_progress = n;
        break;
      case BuildStatus::kSuccess:
        counts.succeeded = n;
        break;
      case BuildStatus::kFailure:
        counts.failed = n;
        break;
    }
  }
  conn.Check(rc, "count builds");
  return counts;
}

// ------------------------------------------------------------------
// Mutations
// ------------------------------------------------------------------

void SqliteBuildStore::AppendLog(const std::string& id, const std::string& message) {
  std::lock_guard lock(db_->WriteLock());
  Transaction     tx(*db_);

  RequireStatus(db_->Handle(), id);

  auto stmt = db_->Prepare(
      "INSERT INTO build_logs(build_id,seq,created_at_ms,message) "
      "VALUES(?1,(SELECT COALESCE(MAX(seq)+1,0) FROM build_logs WHERE build_id=?1),?2,?3);");
  BindText(stmt.get(), 1, id);
  BindInt64(stmt.get(), 2, NowMs());
  BindText(stmt.get(), 3, message);
  db_->Check(sqlite3_step(stmt.get()), "append build log");

  tx.Commit();
}

void SqliteBuildStore::AddArtifact(const std::string& id, const model::ArtifactRecord& artifact) {
  std::lock_guard lock(db_->WriteLock());
  Transaction     tx(*db_);

  RequireStatus(db_->Handle(), id);

  auto stmt = db_->Prepare(
      "INSERT INTO build_artifacts(build_id,seq,file_type,file_name,url) "
      "VALUES(?1,(SELECT COALESCE(MAX(seq)+1,0) FROM build_artifacts WHERE build_id=?1),?2,?3,?4);");
  BindText(stmt.get(), 1, id);
  BindText(stmt.get(), 2, std::string(osforge::model::ToString(artifact.type)));
  BindText(stmt.get(), 3, artifact.file_name);
  BindText(stmt.get(), 4, artifact.url);
  db_->Check(sqlite3_step(stmt.get()), "add build artifact");

  tx.Commit();
}

void SqliteBuildStore::SetStatus(const std::string& id, BuildStatus status) {
  std::lock_guard lock(db_->WriteLock());
  Transaction     tx(*db_);

  const auto current = RequireStatus(db_->Handle(), id);
  if (!osforge::model::CanTransition(current, status)) {
    throw util::InvalidState("illegal status transition " + std::string(osforge::model::ToString(current)) + " -> " +
                             std::string(osforge::model::ToString(status)) + " for build " + id);
  }

  auto stmt = db_->Prepare("UPDATE builds SET status=?, completed_at_ms=? WHERE id=?;");
  BindInt64(stmt.get(), 1, static_cast<std::int64_t>(status));
  if (osforge::model::IsTerminal(status)) {
    BindInt64(stmt.get(), 2, NowMs());
  } else {
    sqlite3_bind_null(stmt.get(), 2);
  }
  BindText(stmt.get(), 3, id);
  db_->Check(sqlite3_step(stmt.get()), "update build status");

  tx.Commit();
}

} // namespace osforge::db::sqlite
