#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/db/api/build_store.hpp"
#include "internal/pipeline/pipeline_executor.hpp"

namespace osforge::scheduler {

/*
  Accepts build submissions and runs each one as its own tracked task.

  Submit validates synchronously (util::ValidationError, no record created),
  inserts a PENDING record and launches the pipeline with std::async. It
  returns as soon as the task is launched. Builds run concurrently with no
  ordering between them.
*/
class BuildScheduler {
 public:
  BuildScheduler(std::shared_ptr<db::BuildStore> store, std::shared_ptr<pipeline::PipelineExecutor> executor);
  ~BuildScheduler();

  BuildScheduler(const BuildScheduler&)            = delete;
  BuildScheduler& operator=(const BuildScheduler&) = delete;

  std::string Submit(std::string_view spec_json);
  std::string Submit(const osforge::build::v1::BuildSpecification& spec);

  // Terminal status once the build finishes within timeout, otherwise nullopt.
  std::optional<osforge::model::BuildStatus> Wait(const std::string& build_id, std::chrono::milliseconds timeout);

  // Refuses new submissions and blocks until every tracked build finishes.
  void Shutdown();

  std::size_t InFlight() const;

 private:
  std::string Launch(const osforge::build::v1::BuildSpecification& validated);

  // Drops finished tasks and publishes the in-flight gauge. Caller holds mutex_.
  void PruneLocked();

  std::shared_ptr<db::BuildStore>              store_;
  std::shared_ptr<pipeline::PipelineExecutor>  executor_;
  mutable std::mutex                           mutex_;
  bool                                         shutting_down_ = false;
  std::unordered_map<std::string, std::shared_future<osforge::model::BuildStatus>> tasks_;
};

} // namespace osforge::scheduler
