#include "client/cpp/status_poller.h"

#include <cassert>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

using osforge::build::v1::GetBuildStatusResponse;
using osforge::client::PollOptions;
using osforge::client::StatusPoller;

// Scripted server plus a manual clock that only moves when the poller sleeps
// or a fetch is charged fetch_cost.
struct Script {
  std::vector<grpc::Status>                    statuses;
  std::vector<osforge::build::v1::BuildStatus> build_statuses;
  std::size_t                                  next = 0;
  std::vector<std::chrono::milliseconds>       sleeps;
  std::vector<std::chrono::milliseconds>       budgets;
  std::chrono::milliseconds                    fetch_cost{0};
  std::chrono::steady_clock::time_point        now{};

  StatusPoller::Fetch Fetch() {
    return [this](GetBuildStatusResponse* resp, std::chrono::milliseconds budget) {
      budgets.push_back(budget);
      now += fetch_cost;
      const auto i = std::min(next++, statuses.size() - 1);
      if (statuses[i].ok()) {
        resp->set_status(build_statuses[i]);
      }
      return statuses[i];
    };
  }

  StatusPoller::Sleep Sleep() {
    return [this](std::chrono::milliseconds d) {
      sleeps.push_back(d);
      now += d;
    };
  }

  StatusPoller::Clock Clock() {
    return [this] { return now; };
  }

  StatusPoller Poller(PollOptions options) {
    return StatusPoller(Fetch(), options, Sleep(), Clock());
  }
};

void TestPollsUntilTerminal() {
  Script script;
  script.statuses       = {grpc::Status::OK, grpc::Status::OK, grpc::Status::OK};
  script.build_statuses = {osforge::build::v1::PENDING, osforge::build::v1::IN_PROGRESS, osforge::build::v1::SUCCESS};

  StatusPoller poller = script.Poller(PollOptions{5s, 600s});
  auto         outcome = poller.Run();

  assert(outcome.completed);
  assert(outcome.polls == 3);
  assert(outcome.last.status() == osforge::build::v1::SUCCESS);
  assert(script.sleeps == (std::vector<std::chrono::milliseconds>{5s, 5s}));
}

void TestTransientErrorsDoNotAbort() {
  Script script;
  script.statuses       = {grpc::Status(grpc::StatusCode::UNAVAILABLE, "down"), grpc::Status(grpc::StatusCode::UNAVAILABLE, "down"),
                           grpc::Status::OK};
  script.build_statuses = {osforge::build::v1::PENDING, osforge::build::v1::PENDING, osforge::build::v1::FAILURE};

  int          reported = 0;
  StatusPoller poller = script.Poller(PollOptions{1s, 60s});
  poller.SetOnError([&reported](const grpc::Status& s) {
    assert(s.error_code() == grpc::StatusCode::UNAVAILABLE);
    ++reported;
  });

  auto outcome = poller.Run();
  assert(outcome.completed);
  assert(outcome.transient_errors == 2);
  assert(reported == 2);
  assert(outcome.last.status() == osforge::build::v1::FAILURE);
}

void TestTimeoutBoundsTheNumberOfPolls() {
  Script script;
  script.statuses       = {grpc::Status::OK};
  script.build_statuses = {osforge::build::v1::IN_PROGRESS};

  StatusPoller poller = script.Poller(PollOptions{5s, 20s});
  auto         outcome = poller.Run();

  assert(!outcome.completed);
  assert(outcome.polls == 5);
  assert(script.sleeps.size() == 4);
  assert(outcome.last.status() == osforge::build::v1::IN_PROGRESS);
}

void TestSlowFetchesCountAgainstTheTimeout() {
  Script script;
  script.statuses       = {grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "slow")};
  script.build_statuses = {osforge::build::v1::PENDING};
  script.fetch_cost     = 300ms;

  StatusPoller poller  = script.Poller(PollOptions{50ms, 200ms});
  auto         outcome = poller.Run();

  assert(!outcome.completed);
  assert(outcome.polls == 1);
  assert(script.sleeps.empty());
  assert(script.budgets == (std::vector<std::chrono::milliseconds>{50ms}));
}

void TestFetchBudgetShrinksToTheRemainingTime() {
  Script script;
  script.statuses       = {grpc::Status::OK};
  script.build_statuses = {osforge::build::v1::IN_PROGRESS};
  script.fetch_cost     = 30ms;

  StatusPoller poller  = script.Poller(PollOptions{50ms, 200ms});
  auto         outcome = poller.Run();

  // fetches start at 0ms, 80ms and 160ms; the third has 40ms left
  assert(!outcome.completed);
  assert(outcome.polls == 3);
  assert(script.budgets == (std::vector<std::chrono::milliseconds>{50ms, 50ms, 40ms}));
  assert(script.now - std::chrono::steady_clock::time_point{} == 190ms);
}

void TestRequiredArtifacts() {
  GetBuildStatusResponse resp;
  auto missing = osforge::client::MissingRequiredArtifacts(resp);
  assert(missing == (std::vector<std::string>{"iso", "docker-image"}));

  resp.add_artifacts()->set_file_type("iso");
  resp.add_artifacts()->set_file_type("docker-image-ref");
  assert(osforge::client::MissingRequiredArtifacts(resp).empty());
}

void TestCommandLineNumbers() {
  std::uint64_t value = 0;
  assert(osforge::client::ParseUnsigned("42", &value));
  assert(value == 42);
  assert(!osforge::client::ParseUnsigned("", &value));
  assert(!osforge::client::ParseUnsigned("soon", &value));
  assert(!osforge::client::ParseUnsigned("-5", &value));
  assert(!osforge::client::ParseUnsigned("12s", &value));
  assert(!osforge::client::ParseUnsigned("99999999999999999999999", &value));
  assert(value == 42);

  assert(osforge::client::ParsePollTimeout("600") == std::chrono::milliseconds(600s));
  assert(!osforge::client::ParsePollTimeout("0").has_value());
  assert(!osforge::client::ParsePollTimeout("ten").has_value());
  assert(!osforge::client::ParsePollTimeout("604801").has_value());
}

void TestHealthRetries() {
  int                                    checks = 0;
  std::vector<std::chrono::milliseconds> sleeps;
  auto sleep = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };

  const bool healthy = osforge::client::WaitUntilHealthy(
      [&checks] { return ++checks < 3 ? grpc::Status(grpc::StatusCode::UNAVAILABLE, "starting") : grpc::Status::OK; }, 10, 1s, sleep);
  assert(healthy);
  assert(checks == 3);
  assert(sleeps.size() == 2);

  checks = 0;
  sleeps.clear();
  const bool never = osforge::client::WaitUntilHealthy(
      [&checks] {
        ++checks;
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "down");
      },
      10, 1s, sleep);
  assert(!never);
  assert(checks == 10);
  assert(sleeps.size() == 9);
}

} // namespace

int main() {
  TestPollsUntilTerminal();
  TestTransientErrorsDoNotAbort();
  TestTimeoutBoundsTheNumberOfPolls();
  TestSlowFetchesCountAgainstTheTimeout();
  TestFetchBudgetShrinksToTheRemainingTime();
  TestRequiredArtifacts();
  TestCommandLineNumbers();
  TestHealthRetries();

  std::cout << "osforge_unit_status_poller: pass\n";
  return 0;
}
