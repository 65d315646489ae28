#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "fake_toolchain.hpp"
#include "internal/db/memory/memory_build_store.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/build_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/pipeline/stages.hpp"
#include "internal/scheduler/build_scheduler.hpp"
#include "internal/service/service_context.hpp"
#include "osforge/build/v1.hpp"

namespace {

osforge::service::ServiceContext BuildServiceContext(const osforge::testing::FakeToolchain& tools) {
  const auto root = osforge::testing::FreshDir("osforge_grpc_status_tests", "ctx");

  osforge::service::ServiceContext ctx;
  ctx.store     = std::make_shared<osforge::db::memory::MemoryBuildStore>();
  auto registry = std::make_shared<osforge::pipeline::ArtifactRegistry>(root / "artifacts");
  osforge::pipeline::ExecutorOptions options;
  options.workspace_root = root / "workspaces";
  auto executor = std::make_shared<osforge::pipeline::PipelineExecutor>(ctx.store, osforge::pipeline::MakeDefaultStages(tools.Get(), registry, ""),
                                                                        options);
  ctx.scheduler = std::make_shared<osforge::scheduler::BuildScheduler>(ctx.store, executor);
  return ctx;
}

void TestExceptionMapping() {
  using osforge::grpc::ToStatus;

  assert(ToStatus(osforge::util::ValidationError("bad spec")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(osforge::util::InvalidArgument("bad id")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(osforge::util::NotFound("missing")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(osforge::util::InvalidState("closed")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(osforge::util::ResourceExhausted("threads")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  const auto internal = ToStatus(std::runtime_error("boom"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "boom");
}

void TestInvalidSpecReturnsInvalidArgument() {
  osforge::testing::FakeToolchain tools;
  auto                            ctx = BuildServiceContext(tools);
  osforge::grpc::BuildServer      server(std::make_shared<osforge::service::BuildService>(ctx));

  osforge::build::v1::StartBuildRequest req;
  req.set_spec_json("{ not json");
  osforge::build::v1::StartBuildResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.StartBuild(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message().find("malformed JSON") != std::string::npos);
  assert(resp.build_id().empty());
}

void TestIncompleteTypedSpecReturnsInvalidArgument() {
  osforge::testing::FakeToolchain tools;
  auto                            ctx = BuildServiceContext(tools);
  osforge::grpc::BuildServer      server(std::make_shared<osforge::service::BuildService>(ctx));

  osforge::build::v1::StartBuildRequest req;
  auto*                                 spec = req.mutable_spec();
  spec->set_base("arch");
  spec->set_kernel("linux-zen");
  spec->set_init("systemd");
  spec->set_architecture("x86_64");
  osforge::build::v1::StartBuildResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.StartBuild(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message().find("display is required") != std::string::npos);
  assert(status.error_message().find("defaults is required") != std::string::npos);
  assert(resp.build_id().empty());
  assert(ctx.store->List().empty());
}

void TestMalformedAndUnknownIds() {
  osforge::testing::FakeToolchain tools;
  auto                            ctx = BuildServiceContext(tools);
  osforge::grpc::BuildServer      server(std::make_shared<osforge::service::BuildService>(ctx));

  osforge::build::v1::GetBuildStatusRequest  req;
  osforge::build::v1::GetBuildStatusResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  req.set_build_id("not-a-uuid");
  assert(server.GetBuildStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_build_id("00000000-0000-4000-8000-000000000000");
  assert(server.GetBuildStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  osforge::build::v1::GetBuildLogsRequest  logs_req;
  osforge::build::v1::GetBuildLogsResponse logs_resp;
  logs_req.set_build_id("00000000-0000-4000-8000-000000000000");
  assert(server.GetBuildLogs(&grpc_ctx, &logs_req, &logs_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSubmitAfterShutdownReturnsFailedPrecondition() {
  osforge::testing::FakeToolchain tools;
  auto                            ctx = BuildServiceContext(tools);
  osforge::grpc::BuildServer      server(std::make_shared<osforge::service::BuildService>(ctx));
  ctx.scheduler->Shutdown();

  osforge::build::v1::StartBuildRequest req;
  req.set_spec_json(osforge::testing::SampleSpecJson());
  osforge::build::v1::StartBuildResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  assert(server.StartBuild(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestHealthIsOk() {
  osforge::testing::FakeToolchain tools;
  auto                            ctx = BuildServiceContext(tools);
  osforge::grpc::AdminServer      server(std::make_shared<osforge::service::AdminService>(ctx));

  osforge::build::v1::HealthRequest  req;
  osforge::build::v1::HealthResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  assert(server.Health(&grpc_ctx, &req, &resp).ok());
  assert(resp.status() == "ok");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestInvalidSpecReturnsInvalidArgument();
  TestIncompleteTypedSpecReturnsInvalidArgument();
  TestMalformedAndUnknownIds();
  TestSubmitAfterShutdownReturnsFailedPrecondition();
  TestHealthIsOk();

  std::cout << "osforge_unit_grpc_status: pass\n";
  return 0;
}
