#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "client/cpp/status_poller.h"
#include "osforge/build/v1.hpp"

using namespace osforge::build::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  osforgectl <addr> health\n"
            << "  osforgectl <addr> start <spec.json>\n"
            << "  osforgectl <addr> status <build_id>\n"
            << "  osforgectl <addr> logs <build_id> [offset]\n"
            << "  osforgectl <addr> stats\n"
            << "  osforgectl <addr> run <spec.json> [timeout_s]\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  *out = ss.str();
  return true;
}

static void PrintLogs(const google::protobuf::RepeatedPtrField<LogEntry>& logs) {
  for (const auto& entry : logs) {
    std::cout << google::protobuf::util::TimeUtil::ToString(entry.created_at()) << " " << entry.message() << "\n";
  }
}

static void PrintArtifacts(const GetBuildStatusResponse& resp) {
  for (const auto& artifact : resp.artifacts()) {
    std::cout << "artifact " << artifact.file_type() << " " << artifact.file_name() << " " << artifact.url() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto build_stub = BuildService::NewStub(channel);
  auto admin_stub = AdminService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "health") {
    HealthRequest  req;
    HealthResponse resp;

    grpc::ClientContext ctx;
    auto status = admin_stub->Health(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << resp.status() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 4) return 1;

    StartBuildRequest req;
    if (!ReadFile(argv[3], req.mutable_spec_json())) {
      std::cerr << "cannot read " << argv[3] << "\n";
      return 1;
    }

    StartBuildResponse resp;

    grpc::ClientContext ctx;
    auto status = build_stub->StartBuild(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "build_id=" << resp.build_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetBuildStatusRequest req;
    req.set_build_id(argv[3]);

    GetBuildStatusResponse resp;

    grpc::ClientContext ctx;
    auto status = build_stub->GetBuildStatus(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << BuildStatus_Name(resp.status()) << "\n";
    std::cout << "logs=" << resp.logs_size() << "\n";
    PrintArtifacts(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    if (argc < 4) return 1;

    std::uint64_t offset = 0;
    if (argc >= 5 && !osforge::client::ParseUnsigned(argv[4], &offset)) {
      Usage();
      return 1;
    }

    GetBuildLogsRequest req;
    req.set_build_id(argv[3]);
    req.set_offset(offset);

    GetBuildLogsResponse resp;

    grpc::ClientContext ctx;
    auto status = build_stub->GetBuildLogs(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintLogs(resp.logs());
    std::cout << "status=" << BuildStatus_Name(resp.status()) << " next_offset=" << resp.next_offset() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    grpc::ClientContext ctx;
    auto status = admin_stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "pending=" << resp.builds_pending() << "\n";
    std::cout << "in_progress=" << resp.builds_in_progress() << "\n";
    std::cout << "succeeded=" << resp.builds_succeeded() << "\n";
    std::cout << "failed=" << resp.builds_failed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Health check, submit, poll to completion, verify artifacts.

  if (cmd == "run") {
    if (argc < 4) return 1;

    osforge::client::PollOptions options;
    if (argc >= 5) {
      auto timeout = osforge::client::ParsePollTimeout(argv[4]);
      if (!timeout) {
        Usage();
        return 1;
      }
      options.timeout = *timeout;
    }

    StartBuildRequest req;
    if (!ReadFile(argv[3], req.mutable_spec_json())) {
      std::cerr << "cannot read " << argv[3] << "\n";
      return 1;
    }

    const bool healthy = osforge::client::WaitUntilHealthy(
        [&] {
          HealthRequest       hreq;
          HealthResponse      hresp;
          grpc::ClientContext ctx;
          osforge::client::ApplyDeadline(&ctx, std::chrono::seconds(1));
          return admin_stub->Health(&ctx, hreq, &hresp);
        },
        10, std::chrono::seconds(1));
    if (!healthy) {
      std::cerr << "server at " << addr << " is not healthy\n";
      return 2;
    }

    StartBuildResponse start;
    {
      grpc::ClientContext ctx;
      osforge::client::ApplyDeadline(&ctx, std::chrono::seconds(30));
      auto status = build_stub->StartBuild(&ctx, req, &start);
      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }
    }
    std::cout << "build_id=" << start.build_id() << "\n";

    int printed = 0;

    osforge::client::StatusPoller poller(
        [&](GetBuildStatusResponse* resp, std::chrono::milliseconds budget) {
          GetBuildStatusRequest sreq;
          sreq.set_build_id(start.build_id());
          grpc::ClientContext ctx;
          osforge::client::ApplyDeadline(&ctx, budget);
          return build_stub->GetBuildStatus(&ctx, sreq, resp);
        },
        options);
    poller.SetOnError([](const grpc::Status& s) { std::cerr << "poll failed: " << s.error_message() << "\n"; });
    poller.SetOnPoll([&](const GetBuildStatusResponse& resp) {
      for (int i = printed; i < resp.logs_size(); ++i) {
        std::cout << resp.logs(i).message() << "\n";
      }
      printed = resp.logs_size();
    });

    auto outcome = poller.Run();
    if (!outcome.completed) {
      std::cerr << "build " << start.build_id() << " did not finish in time\n";
      return 3;
    }

    std::cout << "status=" << BuildStatus_Name(outcome.last.status()) << "\n";
    PrintArtifacts(outcome.last);

    if (outcome.last.status() != SUCCESS) {
      return 3;
    }

    auto missing = osforge::client::MissingRequiredArtifacts(outcome.last);
    for (const auto& type : missing) {
      std::cerr << "missing artifact: " << type << "\n";
    }
    return missing.empty() ? 0 : 3;
  }

  Usage();
  return 1;
}
