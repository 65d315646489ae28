#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/build_store.hpp"
#include "internal/pipeline/toolchain.hpp"

namespace osforge::pipeline {

/*
  Append-only log channel for one build.

  Lines are masked for secrets, split on embedded newlines, and appended to
  the store in call order. Blank lines are dropped. Each stored line is also
  mirrored to the process log.
*/
class BuildLog {
 public:
  BuildLog(db::BuildStore& store, std::string build_id);

  void Append(std::string_view line);

  // Sink that forwards into Append; valid while this BuildLog lives.
  LineSink Sink();

  const std::string& BuildId() const {
    return build_id_;
  }

 private:
  void AppendOne(std::string_view line);

  db::BuildStore& store_;
  std::string     build_id_;
};

} // namespace osforge::pipeline
