#include "sanitizer.hpp"

#include <array>
#include <regex>

namespace osforge::util {

namespace {

struct MaskRule {
  std::regex  pattern;
  const char* replacement;
};

const std::array<MaskRule, 4>& Rules() {
  static const std::array<MaskRule, 4> rules = {{
      {std::regex(R"(dckr_pat_[A-Za-z0-9_-]+)"), "dckr_pat_***"},
      {std::regex(R"(ghp_[A-Za-z0-9]+)"), "ghp_***"},
      {std::regex(R"((password[=:]\s*)\S+)", std::regex::icase), "$1***"},
      {std::regex(R"((token[=:]\s*)\S+)", std::regex::icase), "$1***"},
  }};
  return rules;
}

bool IsPackageChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '+' || c == '-';
}

} // namespace

std::string MaskSensitive(std::string_view text) {
  std::string masked(text);
  for (const auto& rule : Rules()) {
    masked = std::regex_replace(masked, rule.pattern, rule.replacement);
  }
  return masked;
}

bool IsValidPackageName(std::string_view name) {
  if (name.empty() || name.front() == '-') {
    return false;
  }
  for (char c : name) {
    if (!IsPackageChar(c)) {
      return false;
    }
  }
  return true;
}

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace osforge::util
