#include "internal/util/sanitizer.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/uuid.hpp"

namespace {

using osforge::util::IsValidPackageName;
using osforge::util::MaskSensitive;
using osforge::util::Trim;

void TestRegistryAndApiTokensAreMasked() {
  assert(MaskSensitive("login with dckr_pat_AbC-123_x done") == "login with dckr_pat_*** done");
  assert(MaskSensitive("push ghp_abcDEF0123 ok") == "push ghp_*** ok");
}

void TestAssignmentsAreMasked() {
  assert(MaskSensitive("password=hunter2") == "password=***");
  assert(MaskSensitive("TOKEN: abc.def more") == "TOKEN: *** more");
  assert(MaskSensitive("nothing secret here") == "nothing secret here");
}

void TestPackageNames() {
  assert(IsValidPackageName("python3-pip"));
  assert(IsValidPackageName("g++"));
  assert(IsValidPackageName("lib.so_1"));
  assert(!IsValidPackageName(""));
  assert(!IsValidPackageName("-rf"));
  assert(!IsValidPackageName("two words"));
  assert(!IsValidPackageName("evil;rm"));
}

void TestTrim() {
  assert(Trim("  git \t\n") == "git");
  assert(Trim("   ").empty());
  assert(Trim("").empty());
}

void TestCanonicalUuid() {
  const auto id = osforge::util::ToString(osforge::util::GenerateUUID());
  assert(osforge::util::IsCanonicalUUID(id));
  assert(id[14] == '4');
  assert(!osforge::util::IsCanonicalUUID("not-a-uuid"));
  assert(!osforge::util::IsCanonicalUUID("123e4567e89b12d3a456426614174000"));
}

} // namespace

int main() {
  TestRegistryAndApiTokensAreMasked();
  TestAssignmentsAreMasked();
  TestPackageNames();
  TestTrim();
  TestCanonicalUuid();

  std::cout << "osforge_unit_sanitizer: pass\n";
  return 0;
}
