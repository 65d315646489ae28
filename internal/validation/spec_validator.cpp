#include "internal/validation/spec_validator.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/model/distribution.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sanitizer.hpp"

namespace osforge::validation {

using osforge::build::v1::BuildSpecification;

namespace {

constexpr std::string_view kRequiredFields[] = {"base", "kernel", "init", "architecture", "display", "packages", "defaults"};

constexpr std::string_view kWaylandCompositors[] = {"hyprland", "sway"};
constexpr std::string_view kXorgWindowManagers[] = {"i3", "dwm", "bspwm"};

bool IsKnownCategory(const std::string& key) {
  return std::find(std::begin(kPackageCategories), std::end(kPackageCategories), key) != std::end(kPackageCategories);
}

template <std::size_t N>
bool OneOf(const std::string& value, const std::string_view (&set)[N]) {
  return std::find(std::begin(set), std::end(set), value) != std::end(set);
}

std::string Join(const std::vector<std::string>& errors) {
  std::string out;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    const auto& e = errors[i];
    if (std::find(errors.begin(), errors.begin() + static_cast<std::ptrdiff_t>(i), e) != errors.begin() + static_cast<std::ptrdiff_t>(i)) {
      continue;
    }
    if (!out.empty()) {
      out += "; ";
    }
    out += e;
  }
  return out;
}

google::protobuf::RepeatedPtrField<std::string>* Category(osforge::build::v1::PackageSelection& packages, std::string_view name) {
  if (name == "system") return packages.mutable_system();
  if (name == "dev") return packages.mutable_dev();
  if (name == "security") return packages.mutable_security();
  if (name == "utils") return packages.mutable_utils();
  if (name == "media") return packages.mutable_media();
  return packages.mutable_browsers();
}

// Trims every package name in place, recording empty or malformed ones.
void NormalizePackages(osforge::build::v1::PackageSelection& packages, std::vector<std::string>& errors) {
  for (auto name : kPackageCategories) {
    auto* list = Category(packages, name);
    for (int i = 0; i < list->size(); ++i) {
      auto* entry   = list->Mutable(i);
      auto  trimmed = std::string(util::Trim(*entry));
      if (trimmed.empty()) {
        errors.push_back("packages." + std::string(name) + "[" + std::to_string(i) + "] is empty");
      } else if (!util::IsValidPackageName(trimmed)) {
        errors.push_back("packages." + std::string(name) + "[" + std::to_string(i) + "] has an invalid name: " + trimmed);
      }
      *entry = std::move(trimmed);
    }
  }
}

void CheckDistribution(const BuildSpecification& spec, std::vector<std::string>& errors) {
  auto base = model::ParseBaseDistro(spec.base());
  auto init = model::ParseInitSystem(spec.init());

  if (spec.base().empty()) {
    errors.push_back("base is required");
  } else if (!base) {
    errors.push_back("unsupported base distribution: " + spec.base());
  }

  if (util::Trim(spec.kernel()).empty()) {
    errors.push_back("kernel is required");
  }

  if (spec.init().empty()) {
    errors.push_back("init is required");
  } else if (!init) {
    errors.push_back("unsupported init system: " + spec.init());
  }

  if (spec.architecture().empty()) {
    errors.push_back("architecture is required");
  } else if (!model::ParseArchitecture(spec.architecture())) {
    errors.push_back("unsupported architecture: " + spec.architecture());
  }

  if (base && init && !model::SupportsInit(*base, *init)) {
    errors.push_back("init system " + spec.init() + " is not available on " + spec.base());
  }
}

void CheckDisplay(const osforge::build::v1::DisplaySpecification& display, std::vector<std::string>& errors) {
  const auto& compositor = display.compositor();
  if (OneOf(compositor, kWaylandCompositors) && display.server() != "wayland") {
    errors.push_back("compositor " + compositor + " requires display server wayland");
  }
  if (OneOf(compositor, kXorgWindowManagers) && display.server() != "xorg") {
    errors.push_back("compositor " + compositor + " requires display server xorg");
  }
}

void CheckDefaults(const osforge::build::v1::SystemDefaults& defaults, std::vector<std::string>& errors) {
  if (defaults.has_swappiness() && (defaults.swappiness() < 0 || defaults.swappiness() > 100)) {
    errors.push_back("defaults.swappiness must be within [0, 100], got " + std::to_string(defaults.swappiness()));
  }
}

// Message-typed sections have presence; an unset one was never supplied.
void CheckSections(const BuildSpecification& spec, std::vector<std::string>& errors) {
  if (!spec.has_display()) {
    errors.push_back("display is required");
  }
  if (!spec.has_packages()) {
    errors.push_back("packages is required");
  }
  if (!spec.has_defaults()) {
    errors.push_back("defaults is required");
  }
}

// Normalizes spec in place and appends every violation.
void CheckAll(BuildSpecification& spec, std::vector<std::string>& errors) {
  CheckDistribution(spec, errors);
  CheckSections(spec, errors);
  CheckDisplay(spec.display(), errors);
  CheckDefaults(spec.defaults(), errors);
  NormalizePackages(*spec.mutable_packages(), errors);
}

} // namespace

// ------------------------------------------------------------
// Typed checks
// ------------------------------------------------------------

std::vector<std::string> SpecValidator::Check(const BuildSpecification& spec) {
  std::vector<std::string> errors;
  BuildSpecification       copy = spec;
  CheckAll(copy, errors);
  return errors;
}

BuildSpecification SpecValidator::Validate(const BuildSpecification& spec) {
  BuildSpecification normalized = spec;

  std::vector<std::string> errors;
  CheckAll(normalized, errors);

  if (!errors.empty()) {
    throw util::ValidationError("invalid build specification: " + Join(errors));
  }
  return normalized;
}

// ------------------------------------------------------------
// JSON entry point
// ------------------------------------------------------------

BuildSpecification SpecValidator::Validate(std::string_view json) {
  // Structural pass on the generic JSON tree first: it can name missing
  // sections and unknown package categories precisely.
  google::protobuf::Struct document;
  auto                     parsed = google::protobuf::util::JsonStringToMessage(std::string(json), &document);
  if (!parsed.ok()) {
    throw util::ValidationError("invalid build specification: malformed JSON: " + std::string(parsed.message()));
  }

  std::vector<std::string> errors;
  auto&                    fields = *document.mutable_fields();

  for (auto required : kRequiredFields) {
    if (fields.count(std::string(required)) == 0) {
      errors.push_back(std::string(required) + " is required");
    }
  }

  for (auto key : {"display", "packages", "defaults"}) {
    auto it = fields.find(std::string(key));
    if (it != fields.end() && !it->second.has_struct_value()) {
      errors.push_back(std::string(key) + " must be an object");
      fields.erase(it);
    }
  }

  auto packages_it = fields.find("packages");
  if (packages_it != fields.end()) {
    auto& categories = *packages_it->second.mutable_struct_value()->mutable_fields();
    for (auto it = categories.begin(); it != categories.end();) {
      if (!IsKnownCategory(it->first)) {
        errors.push_back("unknown package category: " + it->first);
        it = categories.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::string cleaned;
  auto        encoded = google::protobuf::util::MessageToJsonString(document, &cleaned);
  if (!encoded.ok()) {
    throw util::ValidationError("invalid build specification: " + std::string(encoded.message()));
  }

  BuildSpecification                       spec;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  auto typed                    = google::protobuf::util::JsonStringToMessage(cleaned, &spec, options);
  if (!typed.ok()) {
    errors.push_back(std::string(typed.message()));
    throw util::ValidationError("invalid build specification: " + Join(errors));
  }

  CheckAll(spec, errors);

  if (!errors.empty()) {
    throw util::ValidationError("invalid build specification: " + Join(errors));
  }
  return spec;
}

} // namespace osforge::validation
