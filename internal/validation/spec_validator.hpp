#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "osforge/build/v1.hpp"

namespace osforge::validation {

inline constexpr std::string_view kPackageCategories[] = {"system", "dev", "security", "utils", "media", "browsers"};

/*
  Build specification validation.

  Both entry points return a normalized copy (package names trimmed, every
  category present) or throw util::ValidationError whose message lists every
  violation found, separated by "; ". Nothing is mutated or recorded.
*/
class SpecValidator {
 public:
  static osforge::build::v1::BuildSpecification Validate(std::string_view json);
  static osforge::build::v1::BuildSpecification Validate(const osforge::build::v1::BuildSpecification& spec);

  // Violations without throwing; empty means valid.
  static std::vector<std::string> Check(const osforge::build::v1::BuildSpecification& spec);
};

} // namespace osforge::validation
