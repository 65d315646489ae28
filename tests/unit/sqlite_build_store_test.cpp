#include "internal/db/sqlite/sqlite_build_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using osforge::db::sqlite::SqliteBuildStore;
using osforge::db::sqlite::SqliteDB;
using osforge::model::ArtifactType;
using osforge::model::BuildStatus;

std::string FreshDatabase(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "osforge_sqlite_build_store_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const auto* suffix : {"", "-wal", "-shm"}) {
    fs::remove(path.string() + suffix);
  }
  return path.string();
}

osforge::build::v1::BuildSpecification MakeSpec() {
  osforge::build::v1::BuildSpecification spec;
  spec.set_name("SteelOS");
  spec.set_base("arch");
  spec.add_security_features("secure-boot");
  spec.mutable_defaults()->set_swappiness(10);
  return spec;
}

void TestRecordSurvivesReopen() {
  const auto  path = FreshDatabase("reopen");
  std::string id;
  {
    SqliteBuildStore store(std::make_shared<SqliteDB>(path));
    id = store.Create(MakeSpec());
    store.SetStatus(id, BuildStatus::kInProgress);
    store.AppendLog(id, "Stage 1/7 resolve-packages: started");
    store.AppendLog(id, "build succeeded");
    store.AddArtifact(id, {ArtifactType::kIso, "steel.iso", "/artifacts/steel.iso"});
    store.AddArtifact(id, {ArtifactType::kDockerImageRef, "docker-manifest", "registry/osforge:latest"});
    store.SetStatus(id, BuildStatus::kSuccess);
  }

  SqliteBuildStore reopened(std::make_shared<SqliteDB>(path));
  auto             record = reopened.Get(id);
  assert(record.has_value());
  assert(record->spec.name() == "SteelOS");
  assert(record->spec.security_features_size() == 1);
  assert(record->spec.defaults().swappiness() == 10);
  assert(record->status == BuildStatus::kSuccess);
  assert(record->completed_at.has_value());
  assert(record->logs.size() == 2);
  assert(record->logs[1].message == "build succeeded");
  assert(record->artifacts.size() == 2);
  assert(record->artifacts[1].type == ArtifactType::kDockerImageRef);
  assert(record->artifacts[1].url == "registry/osforge:latest");
}

void TestReadLogsFromOffset() {
  SqliteBuildStore store(std::make_shared<SqliteDB>(FreshDatabase("logs")));
  const auto       id = store.Create(MakeSpec());
  store.AppendLog(id, "one");
  store.AppendLog(id, "two");
  store.AppendLog(id, "three");

  auto tail = store.ReadLogs(id, 1);
  assert(tail.status == BuildStatus::kPending);
  assert(tail.entries.size() == 2);
  assert(tail.entries[0].message == "two");
  assert(tail.next_offset == 3);

  auto empty = store.ReadLogs(id, 3);
  assert(empty.entries.empty());
  assert(empty.next_offset == 3);
}

void TestIllegalTransitionIsRolledBack() {
  SqliteBuildStore store(std::make_shared<SqliteDB>(FreshDatabase("transition")));
  const auto       id = store.Create(MakeSpec());
  store.SetStatus(id, BuildStatus::kFailure);

  bool threw = false;
  try {
    store.SetStatus(id, BuildStatus::kInProgress);
  } catch (const osforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get(id)->status == BuildStatus::kFailure);
}

void TestUnknownIds() {
  SqliteBuildStore store(std::make_shared<SqliteDB>(FreshDatabase("unknown")));
  assert(!store.Get("00000000-0000-4000-8000-000000000000").has_value());

  bool threw = false;
  try {
    store.AppendLog("00000000-0000-4000-8000-000000000000", "line");
  } catch (const osforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestIdCollisionRetriesAndCounts() {
  int              calls = 0;
  SqliteBuildStore store(std::make_shared<SqliteDB>(FreshDatabase("collision")),
                         [&calls] { return ++calls < 3 ? std::string("fixed") : "other-" + std::to_string(calls); });

  assert(store.Create(MakeSpec()) == "fixed");
  assert(store.Create(MakeSpec()) == "other-3");

  store.SetStatus("fixed", BuildStatus::kInProgress);
  auto counts = store.CountByStatus();
  assert(counts.pending == 1);
  assert(counts.in_progress == 1);
  assert(store.List().size() == 2);
}

// A write transaction left open on build B must not stall queries on build A.
void TestReadsProceedDuringOpenWrite() {
  auto             db = std::make_shared<SqliteDB>(FreshDatabase("concurrent"));
  SqliteBuildStore store(db);
  const auto       a = store.Create(MakeSpec());
  const auto       b = store.Create(MakeSpec());
  store.AppendLog(a, "a: resolving packages");
  store.AppendLog(b, "b: resolving packages");

  {
    std::lock_guard                  lock(db->WriteLock());
    osforge::db::sqlite::Transaction tx(*db);
    db->Exec("INSERT INTO build_logs(build_id,seq,created_at_ms,message) VALUES('" + b + "',1,0,'b: uncommitted');");

    auto status = std::async(std::launch::async, [&] { return store.Get(a); });
    assert(status.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto record = status.get();
    assert(record.has_value());
    assert(record->logs.size() == 1);

    auto logs = std::async(std::launch::async, [&] { return store.ReadLogs(b, 0); });
    assert(logs.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto slice = logs.get();
    assert(slice.entries.size() == 1);
    assert(slice.entries[0].message == "b: resolving packages");

    auto counts = std::async(std::launch::async, [&] { return store.CountByStatus(); });
    assert(counts.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(counts.get().pending == 2);

    tx.Commit();
  }

  assert(store.ReadLogs(b, 0).entries.size() == 2);
}

void TestInMemoryPathIsRejected() {
  bool threw = false;
  try {
    SqliteDB db(":memory:");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRecordSurvivesReopen();
  TestReadLogsFromOffset();
  TestIllegalTransitionIsRolledBack();
  TestUnknownIds();
  TestIdCollisionRetriesAndCounts();
  TestReadsProceedDuringOpenWrite();
  TestInMemoryPathIsRejected();

  std::cout << "osforge_unit_sqlite_build_store: pass\n";
  return 0;
}
