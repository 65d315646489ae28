#pragma once

#include <grpcpp/client_context.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "osforge/build/v1.hpp"

namespace osforge::client {

struct PollOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
};

struct PollOutcome {
  // True once a terminal status was observed before the timeout.
  bool                                       completed = false;
  osforge::build::v1::GetBuildStatusResponse last;
  int                                        polls            = 0;
  int                                        transient_errors = 0;
};

/*
  Client side of the polling contract.

  Fetches the status every interval until it is SUCCESS or FAILURE or the
  timeout elapses. A failed poll is reported to on_error and polling goes
  on; it never aborts the loop.

  Elapsed time is measured on the clock from the start of Run(), so slow
  fetches count against the timeout. Each fetch is handed a budget of at most
  one interval, which callers turn into an RPC deadline with ApplyDeadline;
  a run therefore lasts no longer than timeout plus one interval.
*/
class StatusPoller {
 public:
  using Fetch   = std::function<::grpc::Status(osforge::build::v1::GetBuildStatusResponse*, std::chrono::milliseconds budget)>;
  using Sleep   = std::function<void(std::chrono::milliseconds)>;
  using Clock   = std::function<std::chrono::steady_clock::time_point()>;
  using OnError = std::function<void(const ::grpc::Status&)>;
  using OnPoll  = std::function<void(const osforge::build::v1::GetBuildStatusResponse&)>;

  StatusPoller(Fetch fetch, PollOptions options, Sleep sleep = {}, Clock clock = {});

  void SetOnError(OnError on_error) {
    on_error_ = std::move(on_error);
  }

  void SetOnPoll(OnPoll on_poll) {
    on_poll_ = std::move(on_poll);
  }

  PollOutcome Run() const;

 private:
  Fetch       fetch_;
  PollOptions options_;
  Sleep       sleep_;
  Clock       clock_;
  OnError     on_error_;
  OnPoll      on_poll_;
};

// Sets ctx's deadline budget from now.
void ApplyDeadline(::grpc::ClientContext* ctx, std::chrono::milliseconds budget);

bool IsTerminal(osforge::build::v1::BuildStatus status);

// Required artifact types the response lacks: "iso", and "docker-image"
// unless a docker-image or docker-image-ref artifact is present.
std::vector<std::string> MissingRequiredArtifacts(const osforge::build::v1::GetBuildStatusResponse& status);

// Whole-string unsigned decimal; signs, blanks and trailing text are rejected.
bool ParseUnsigned(std::string_view text, std::uint64_t* out);

// A timeout given in whole seconds, between 1s and one week.
std::optional<std::chrono::milliseconds> ParsePollTimeout(std::string_view seconds);

// Calls check up to attempts times, sleeping delay between failures.
bool WaitUntilHealthy(const std::function<::grpc::Status()>& check, int attempts, std::chrono::milliseconds delay, const StatusPoller::Sleep& sleep = {});

} // namespace osforge::client
