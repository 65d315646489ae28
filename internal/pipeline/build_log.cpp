#include "internal/pipeline/build_log.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/sanitizer.hpp"

namespace osforge::pipeline {

BuildLog::BuildLog(db::BuildStore& store, std::string build_id) : store_(store), build_id_(std::move(build_id)) {
}

void BuildLog::Append(std::string_view line) {
  std::size_t start = 0;
  while (start <= line.size()) {
    auto nl = line.find('\n', start);
    if (nl == std::string_view::npos) {
      AppendOne(line.substr(start));
      break;
    }
    AppendOne(line.substr(start, nl - start));
    start = nl + 1;
  }
}

void BuildLog::AppendOne(std::string_view line) {
  auto trimmed = util::Trim(line);
  if (trimmed.empty()) {
    return;
  }

  // Keep leading indentation of tool output, strip only the line ending.
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }

  auto masked = util::MaskSensitive(line);
  observability::LogBuildLine(build_id_, masked);
  store_.AppendLog(build_id_, masked);
}

LineSink BuildLog::Sink() {
  return [this](std::string_view line) { Append(line); };
}

} // namespace osforge::pipeline
