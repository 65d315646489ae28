#pragma once

#include <string>
#include <string_view>

namespace osforge::util {

// Replaces registry tokens, API tokens and password/token assignments
// with "***" so build logs can be shown to any client.
std::string MaskSensitive(std::string_view text);

// Package names: [A-Za-z0-9._+-], non-empty, not starting with '-'.
bool IsValidPackageName(std::string_view name);

std::string_view Trim(std::string_view text);

} // namespace osforge::util
