#include "internal/db/memory/memory_build_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using osforge::db::memory::MemoryBuildStore;
using osforge::model::ArtifactType;
using osforge::model::BuildStatus;

osforge::build::v1::BuildSpecification MakeSpec(const std::string& name) {
  osforge::build::v1::BuildSpecification spec;
  spec.set_name(name);
  spec.set_base("arch");
  return spec;
}

void TestCreateStartsPendingWithCanonicalId() {
  MemoryBuildStore store;
  const auto       id = store.Create(MakeSpec("first"));

  assert(osforge::util::IsCanonicalUUID(id));
  auto record = store.Get(id);
  assert(record.has_value());
  assert(record->status == BuildStatus::kPending);
  assert(record->spec.name() == "first");
  assert(record->logs.empty());
  assert(!record->completed_at.has_value());
}

void TestGetUnknownIdReturnsNothing() {
  MemoryBuildStore store;
  assert(!store.Get("00000000-0000-4000-8000-000000000000").has_value());
}

void TestIdCollisionRetries() {
  int              calls = 0;
  MemoryBuildStore store([&calls] { return ++calls < 3 ? std::string("fixed") : std::string("other-") + std::to_string(calls); });

  assert(store.Create(MakeSpec("a")) == "fixed");
  assert(store.Create(MakeSpec("b")) == "other-3");
}

void TestIdSpaceExhausted() {
  MemoryBuildStore store([] { return std::string("same"); });
  store.Create(MakeSpec("a"));

  bool threw = false;
  try {
    store.Create(MakeSpec("b"));
  } catch (const osforge::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

void TestStatusTransitions() {
  MemoryBuildStore store;
  const auto       id = store.Create(MakeSpec("t"));

  store.SetStatus(id, BuildStatus::kInProgress);

  bool threw = false;
  try {
    store.SetStatus(id, BuildStatus::kPending);
  } catch (const osforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  store.SetStatus(id, BuildStatus::kSuccess);
  auto record = store.Get(id);
  assert(record->status == BuildStatus::kSuccess);
  assert(record->completed_at.has_value());
  assert(*record->completed_at >= record->created_at);

  threw = false;
  try {
    store.SetStatus(id, BuildStatus::kFailure);
  } catch (const osforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestPendingCanFailDirectly() {
  MemoryBuildStore store;
  const auto       id = store.Create(MakeSpec("t"));
  store.SetStatus(id, BuildStatus::kFailure);
  assert(store.Get(id)->status == BuildStatus::kFailure);
}

void TestMutatorsOnUnknownIdThrowNotFound() {
  MemoryBuildStore store;
  bool             threw = false;
  try {
    store.AppendLog("missing", "line");
  } catch (const osforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    store.ReadLogs("missing", 0);
  } catch (const osforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReadLogsFromOffset() {
  MemoryBuildStore store;
  const auto       id = store.Create(MakeSpec("logs"));
  store.AppendLog(id, "one");
  store.AppendLog(id, "two");
  store.AppendLog(id, "three");

  auto all = store.ReadLogs(id, 0);
  assert(all.entries.size() == 3);
  assert(all.next_offset == 3);
  assert(all.status == BuildStatus::kPending);

  auto tail = store.ReadLogs(id, 2);
  assert(tail.entries.size() == 1);
  assert(tail.entries.front().message == "three");

  auto past_end = store.ReadLogs(id, 10);
  assert(past_end.entries.empty());
  assert(past_end.next_offset == 10);
}

void TestArtifactsAndCounts() {
  MemoryBuildStore store;
  const auto       a = store.Create(MakeSpec("a"));
  const auto       b = store.Create(MakeSpec("b"));
  store.Create(MakeSpec("c"));

  store.AddArtifact(a, {ArtifactType::kIso, "a.iso", "/artifacts/a/a.iso"});
  assert(store.Get(a)->artifacts.size() == 1);
  assert(store.Get(a)->artifacts.front().file_name == "a.iso");

  store.SetStatus(a, BuildStatus::kInProgress);
  store.SetStatus(b, BuildStatus::kInProgress);
  store.SetStatus(b, BuildStatus::kFailure);

  auto counts = store.CountByStatus();
  assert(counts.pending == 1);
  assert(counts.in_progress == 1);
  assert(counts.failed == 1);
  assert(counts.succeeded == 0);
  assert(store.List().size() == 3);
}

void TestConcurrentAppendsKeepEveryLine() {
  MemoryBuildStore store;
  const auto       id = store.Create(MakeSpec("concurrent"));

  constexpr int            kThreads = 4;
  constexpr int            kLines   = 200;
  std::atomic<bool>        stop{false};
  std::vector<std::thread> writers;

  std::thread reader([&] {
    std::size_t last = 0;
    while (!stop.load()) {
      auto size = store.Get(id)->logs.size();
      assert(size >= last);
      last = size;
    }
  });

  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&store, &id, t] {
      for (int i = 0; i < kLines; ++i) {
        store.AppendLog(id, "writer " + std::to_string(t) + " line " + std::to_string(i));
      }
    });
  }
  for (auto& w : writers) {
    w.join();
  }
  stop.store(true);
  reader.join();

  assert(store.Get(id)->logs.size() == static_cast<std::size_t>(kThreads * kLines));
}

} // namespace

int main() {
  TestCreateStartsPendingWithCanonicalId();
  TestGetUnknownIdReturnsNothing();
  TestIdCollisionRetries();
  TestIdSpaceExhausted();
  TestStatusTransitions();
  TestPendingCanFailDirectly();
  TestMutatorsOnUnknownIdThrowNotFound();
  TestReadLogsFromOffset();
  TestArtifactsAndCounts();
  TestConcurrentAppendsKeepEveryLine();

  std::cout << "osforge_unit_memory_build_store: pass\n";
  return 0;
}
