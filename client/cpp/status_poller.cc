#include "client/cpp/status_poller.h"

#include <algorithm>
#include <charconv>
#include <thread>

namespace osforge::client {

namespace {

void DefaultSleep(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

std::chrono::steady_clock::time_point DefaultClock() {
  return std::chrono::steady_clock::now();
}

// A poll that starts at or past the timeout still gets a usable deadline.
constexpr std::chrono::milliseconds kMinFetchBudget{100};

constexpr std::uint64_t kMaxPollTimeoutSeconds = 7 * 24 * 3600;

} // namespace

StatusPoller::StatusPoller(Fetch fetch, PollOptions options, Sleep sleep, Clock clock)
    : fetch_(std::move(fetch)),
      options_(options),
      sleep_(sleep ? std::move(sleep) : Sleep(DefaultSleep)),
      clock_(clock ? std::move(clock) : Clock(DefaultClock)) {}

PollOutcome StatusPoller::Run() const {
  PollOutcome outcome;
  const auto  started = clock_();
  auto        elapsed = [&] { return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started); };

  for (;;) {
    osforge::build::v1::GetBuildStatusResponse resp;
    ++outcome.polls;

    const auto budget = std::max(std::min(options_.interval, options_.timeout - elapsed()), kMinFetchBudget);
    const auto status = fetch_(&resp, budget);
    if (status.ok()) {
      outcome.last = resp;
      if (on_poll_) {
        on_poll_(resp);
      }
      if (IsTerminal(resp.status())) {
        outcome.completed = true;
        return outcome;
      }
    } else {
      ++outcome.transient_errors;
      if (on_error_) {
        on_error_(status);
      }
    }

    if (elapsed() + options_.interval > options_.timeout) {
      return outcome;
    }
    sleep_(options_.interval);
  }
}

void ApplyDeadline(::grpc::ClientContext* ctx, std::chrono::milliseconds budget) {
  ctx->set_deadline(std::chrono::system_clock::now() + budget);
}

bool IsTerminal(osforge::build::v1::BuildStatus status) {
  return status == osforge::build::v1::SUCCESS || status == osforge::build::v1::FAILURE;
}

std::vector<std::string> MissingRequiredArtifacts(const osforge::build::v1::GetBuildStatusResponse& status) {
  const auto& artifacts = status.artifacts();
  auto        has       = [&](const char* type) {
    return std::any_of(artifacts.begin(), artifacts.end(), [type](const auto& a) { return a.file_type() == type; });
  };

  std::vector<std::string> missing;
  if (!has("iso")) {
    missing.emplace_back("iso");
  }
  if (!has("docker-image") && !has("docker-image-ref")) {
    missing.emplace_back("docker-image");
  }
  return missing;
}

bool ParseUnsigned(std::string_view text, std::uint64_t* out) {
  std::uint64_t value = 0;
  const auto* end     = text.data() + text.size();
  auto [ptr, ec]      = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return false;
  }
  *out = value;
  return true;
}

std::optional<std::chrono::milliseconds> ParsePollTimeout(std::string_view seconds) {
  std::uint64_t value = 0;
  if (!ParseUnsigned(seconds, &value) || value == 0 || value > kMaxPollTimeoutSeconds) {
    return std::nullopt;
  }
  return std::chrono::seconds(static_cast<std::int64_t>(value));
}

bool WaitUntilHealthy(const std::function<::grpc::Status()>& check, int attempts, std::chrono::milliseconds delay, const StatusPoller::Sleep& sleep) {
  for (int i = 0; i < attempts; ++i) {
    if (check().ok()) {
      return true;
    }
    if (i + 1 < attempts) {
      if (sleep) {
        sleep(delay);
      } else {
        DefaultSleep(delay);
      }
    }
  }
  return false;
}

} // namespace osforge::client
