#include "internal/scheduler/build_scheduler.hpp"

#include <cassert>
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "fake_toolchain.hpp"
#include "internal/db/memory/memory_build_store.hpp"
#include "internal/pipeline/stages.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;

using osforge::model::BuildStatus;
using osforge::testing::FakeToolchain;

constexpr const char* kSuite = "osforge_build_scheduler_tests";

struct Harness {
  std::shared_ptr<osforge::db::memory::MemoryBuildStore> store = std::make_shared<osforge::db::memory::MemoryBuildStore>();
  FakeToolchain                                          tools;
  std::shared_ptr<osforge::scheduler::BuildScheduler>    scheduler;

  explicit Harness(const std::string& name, std::chrono::milliseconds bootstrap_delay = 0ms) {
    const auto root            = osforge::testing::FreshDir(kSuite, name);
    tools.bootstrapper->delay = bootstrap_delay;

    auto registry = std::make_shared<osforge::pipeline::ArtifactRegistry>(root / "artifacts");
    osforge::pipeline::ExecutorOptions options;
    options.workspace_root = root / "workspaces";
    auto executor =
        std::make_shared<osforge::pipeline::PipelineExecutor>(store, osforge::pipeline::MakeDefaultStages(tools.Get(), registry, ""), options);
    scheduler = std::make_shared<osforge::scheduler::BuildScheduler>(store, executor);
  }
};

int Rank(BuildStatus status) {
  switch (status) {
    case BuildStatus::kPending:
      return 0;
    case BuildStatus::kInProgress:
      return 1;
    default:
      return 2;
  }
}

void TestSubmitRunsBuildToCompletion() {
  Harness h("complete");
  const auto id = h.scheduler->Submit(std::string_view(osforge::testing::SampleSpecJson()));

  assert(osforge::util::IsCanonicalUUID(id));
  auto status = h.scheduler->Wait(id, 10s);
  assert(status.has_value());
  assert(*status == BuildStatus::kSuccess);
  assert(h.store->Get(id)->artifacts.size() == 2);
}

void TestRejectedSpecCreatesNoRecord() {
  Harness h("rejected");
  bool    threw = false;
  try {
    h.scheduler->Submit(std::string_view(R"({"base": "arch"})"));
  } catch (const osforge::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->List().empty());
}

void TestConcurrentBuildsRunIndependently() {
  Harness h("concurrent", 300ms);

  const auto started = std::chrono::steady_clock::now();
  const auto first   = h.scheduler->Submit(osforge::testing::SampleSpec());
  const auto second  = h.scheduler->Submit(osforge::testing::SampleSpec());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  // Submission does not wait for the pipeline.
  assert(elapsed < 300ms);
  assert(first != second);
  assert(!osforge::model::IsTerminal(h.store->Get(first)->status));
  assert(!osforge::model::IsTerminal(h.store->Get(second)->status));

  assert(h.scheduler->Wait(first, 10s) == BuildStatus::kSuccess);
  assert(h.scheduler->Wait(second, 10s) == BuildStatus::kSuccess);

  // Each build only carries its own lines.
  for (const auto& entry : h.store->Get(first)->logs) {
    assert(entry.message.find(second) == std::string::npos);
  }
}

void TestPollingObservesMonotonicProgress() {
  Harness h("monotonic", 100ms);
  const auto id = h.scheduler->Submit(osforge::testing::SampleSpec());

  int                                      last_rank = -1;
  std::vector<osforge::db::model::LogEntry> previous;
  const auto                               deadline = std::chrono::steady_clock::now() + 10s;
  for (;;) {
    auto record = h.store->Get(id);
    assert(record.has_value());
    assert(Rank(record->status) >= last_rank);

    // Earlier reads are a prefix of every later read.
    assert(record->logs.size() >= previous.size());
    for (std::size_t i = 0; i < previous.size(); ++i) {
      assert(record->logs[i].message == previous[i].message);
      assert(record->logs[i].created_at == previous[i].created_at);
    }

    last_rank = Rank(record->status);
    previous  = record->logs;
    if (osforge::model::IsTerminal(record->status)) {
      assert(record->completed_at.has_value());
      break;
    }
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(5ms);
  }
}

void TestStageOutputIsVisibleBeforeStageEnds() {
  Harness            h("mid_stage");
  std::promise<void> release;
  h.tools.bootstrapper->gate = release.get_future().share();

  const auto id       = h.scheduler->Submit(osforge::testing::SampleSpec());
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  for (;;) {
    auto record = h.store->Get(id);
    const bool seen = std::any_of(record->logs.begin(), record->logs.end(),
                                  [](const auto& e) { return e.message.find("installing 2 packages") != std::string::npos; });
    if (seen) {
      // The bootstrapper is still blocked, so the stage has not finished.
      assert(record->status == BuildStatus::kInProgress);
      assert(record->artifacts.empty());
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      release.set_value();
      assert(false && "bootstrap output never appeared");
    }
    std::this_thread::sleep_for(5ms);
  }

  release.set_value();
  assert(h.scheduler->Wait(id, 10s) == BuildStatus::kSuccess);
}

void TestShutdownRefusesNewBuilds() {
  Harness h("shutdown", 50ms);
  const auto id = h.scheduler->Submit(osforge::testing::SampleSpec());

  h.scheduler->Shutdown();
  assert(osforge::model::IsTerminal(h.store->Get(id)->status));
  assert(h.scheduler->InFlight() == 0);

  bool threw = false;
  try {
    h.scheduler->Submit(osforge::testing::SampleSpec());
  } catch (const osforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->List().size() == 1);
}

void TestWaitOnUnknownBuild() {
  Harness h("unknown");
  bool    threw = false;
  try {
    h.scheduler->Wait("00000000-0000-4000-8000-000000000000", 1ms);
  } catch (const osforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSubmitRunsBuildToCompletion();
  TestRejectedSpecCreatesNoRecord();
  TestConcurrentBuildsRunIndependently();
  TestPollingObservesMonotonicProgress();
  TestStageOutputIsVisibleBeforeStageEnds();
  TestShutdownRefusesNewBuilds();
  TestWaitOnUnknownBuild();

  std::cout << "osforge_unit_build_scheduler: pass\n";
  return 0;
}
