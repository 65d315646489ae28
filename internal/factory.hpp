#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/build_store.hpp"
#include "internal/pipeline/toolchain.hpp"
#include "internal/scheduler/build_scheduler.hpp"

namespace osforge::factory {

/*
  Application

  Everything the server needs for the lifetime of the process. The
  scheduler is kept so shutdown can wait for in-flight builds.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<db::BuildStore>               store;
  std::shared_ptr<scheduler::BuildScheduler>    scheduler;
};

/*
  Composition root. The only place that knows concrete store and tool types.
*/
Application Build(const osforge::runtime::config::RuntimeConfig& config);

// Same graph with caller-supplied collaborators (tests, embedding).
Application Build(const osforge::runtime::config::RuntimeConfig& config, const pipeline::Toolchain& toolchain);

std::shared_ptr<db::BuildStore> MakeBuildStore(const osforge::runtime::config::RuntimeConfig& config);

} // namespace osforge::factory
