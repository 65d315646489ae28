#include "internal/pipeline/command_runner.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string_view>

namespace osforge::pipeline {

namespace {

void EmitLines(std::string& pending, const LineSink& sink, bool flush) {
  std::size_t start = 0;
  for (;;) {
    auto nl = pending.find('\n', start);
    if (nl == std::string::npos) {
      break;
    }
    std::string_view line(pending.data() + start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (sink) {
      sink(line);
    }
    start = nl + 1;
  }
  pending.erase(0, start);

  if (flush && !pending.empty()) {
    if (sink) {
      sink(pending);
    }
    pending.clear();
  }
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

/*
  Owns the read end of the output pipe and the child while output streams.
  Unless Finish() ran, destruction closes the pipe, kills the child and reaps
  it, so a throwing sink leaves no descriptor or zombie behind.
*/
class ChildGuard {
 public:
  ChildGuard(pid_t pid, int fd) : pid_(pid), fd_(fd) {
  }

  ChildGuard(const ChildGuard&)            = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  ~ChildGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (pid_ > 0) {
      ::kill(pid_, SIGKILL);
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  int Fd() const {
    return fd_;
  }

  int Finish() {
    ::close(fd_);
    fd_ = -1;

    const auto pid = pid_;
    pid_           = -1;
    return WaitForChild(pid);
  }

 private:
  pid_t pid_;
  int   fd_;
};

} // namespace

CommandOutcome RunCommand(const std::vector<std::string>& argv, const LineSink& sink, const std::optional<std::filesystem::path>& working_dir) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command line");
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) < 0) {
    throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
  }

  // Prepared before fork; the child must not allocate.
  std::vector<char*> args;
  args.reserve(argv.size() + 1U);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);
  const std::string cwd = working_dir ? working_dir->string() : std::string();

  auto pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    ::close(fds[0]);
    if (::dup2(fds[1], STDOUT_FILENO) < 0 || ::dup2(fds[1], STDERR_FILENO) < 0) {
      _exit(127);
    }
    ::close(fds[1]);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }

    if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
      _exit(127);
    }

    ::execvp(args[0], args.data());
    _exit(127);
  }

  ::close(fds[1]);
  ChildGuard child(pid, fds[0]);

  std::string pending;
  char        buffer[4096];
  for (;;) {
    auto n = ::read(child.Fd(), buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    pending.append(buffer, static_cast<std::size_t>(n));
    EmitLines(pending, sink, false);
  }
  EmitLines(pending, sink, true);

  return CommandOutcome{child.Finish()};
}

} // namespace osforge::pipeline
