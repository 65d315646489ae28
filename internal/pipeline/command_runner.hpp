#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/pipeline/toolchain.hpp"

namespace osforge::pipeline {

struct CommandOutcome {
  int exit_code = 0;
};

/*
  Runs argv[0] (PATH lookup) with stdout and stderr merged into one pipe,
  delivering each complete output line to sink as it arrives. Blocks until
  the child exits. Exit code 127 means the program could not be executed;
  a signal death is reported as 128 + signal.

  Throws std::runtime_error if the process cannot be started at all.
*/
CommandOutcome RunCommand(const std::vector<std::string>& argv, const LineSink& sink,
                          const std::optional<std::filesystem::path>& working_dir = std::nullopt);

} // namespace osforge::pipeline
