#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/version_allocator.hpp"
#include "internal/model/semantic_version.hpp"
#include "internal/util/errors.hpp"

namespace {

using modelreg::core::ParseBumpKind;
using modelreg::core::VersionAllocator;
using namespace modelreg::registry::v1;

ModelLine LineWith(std::initializer_list<const char*> versions) {
  ModelLine line;
  for (const char* version : versions) {
    line.add_versions()->set_version(version);
  }
  return line;
}

bool RejectsVersion(const std::string& text) {
  try {
    (void)modelreg::model::ParseVersion(text);
  } catch (const modelreg::util::InvalidVersionFormat&) {
    return true;
  }
  return false;
}

void TestEmptyLineStartsAtOneZeroZero() {
  const ModelLine empty;
  assert(VersionAllocator::NextVersion(empty, BUMP_KIND_PATCH) == "1.0.0");
  assert(VersionAllocator::NextVersion(empty, BUMP_KIND_MINOR) == "1.0.0");
  assert(VersionAllocator::NextVersion(empty, BUMP_KIND_MAJOR) == "1.0.0");
}

void TestBumpKinds() {
  const auto line = LineWith({"1.0.0", "1.2.3"});
  assert(VersionAllocator::NextVersion(line, BUMP_KIND_PATCH) == "1.2.4");
  assert(VersionAllocator::NextVersion(line, BUMP_KIND_MINOR) == "1.3.0");
  assert(VersionAllocator::NextVersion(line, BUMP_KIND_MAJOR) == "2.0.0");
  assert(VersionAllocator::NextVersion(line, BUMP_KIND_UNSPECIFIED) == "1.2.4");
}

void TestUsesLatestRecordOnly() {
  const auto line = LineWith({"1.0.9", "1.0.10"});
  assert(VersionAllocator::NextVersion(line, BUMP_KIND_PATCH) == "1.0.11");
}

void TestMalformedLatestVersionIsRejected() {
  bool threw = false;
  try {
    (void)VersionAllocator::NextVersion(LineWith({"1.0"}), BUMP_KIND_PATCH);
  } catch (const modelreg::util::InvalidVersionFormat&) {
    threw = true;
  }
  assert(threw);
}

void TestOverflowIsRejected() {
  bool threw = false;
  try {
    (void)VersionAllocator::NextVersion(LineWith({"1.0.4294967295"}), BUMP_KIND_PATCH);
  } catch (const modelreg::util::InvalidVersionFormat&) {
    threw = true;
  }
  assert(threw);
}

void TestParseVersionStrictness() {
  assert(!RejectsVersion("0.0.0"));
  assert(!RejectsVersion("10.20.30"));
  assert(RejectsVersion(""));
  assert(RejectsVersion("1"));
  assert(RejectsVersion("1.2"));
  assert(RejectsVersion("1.2.3.4"));
  assert(RejectsVersion("1..3"));
  assert(RejectsVersion("v1.2.3"));
  assert(RejectsVersion("-1.2.3"));
  assert(RejectsVersion("+1.2.3"));
  assert(RejectsVersion(" 1.2.3"));
  assert(RejectsVersion("1.2.3 "));
  assert(RejectsVersion("4294967296.0.0"));
}

void TestCompareUsesIntegerOrder() {
  assert(modelreg::model::CompareVersions("1.0.10", "1.0.9") > 0);
  assert(modelreg::model::CompareVersions("1.2.0", "2.0.0") < 0);
  assert(modelreg::model::CompareVersions("3.1.4", "3.1.4") == 0);
}

void TestParseBumpKind() {
  assert(ParseBumpKind("major") == BUMP_KIND_MAJOR);
  assert(ParseBumpKind("minor") == BUMP_KIND_MINOR);
  assert(ParseBumpKind("patch") == BUMP_KIND_PATCH);

  bool threw = false;
  try {
    (void)ParseBumpKind("PATCH");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyLineStartsAtOneZeroZero();
  TestBumpKinds();
  TestUsesLatestRecordOnly();
  TestMalformedLatestVersionIsRejected();
  TestOverflowIsRejected();
  TestParseVersionStrictness();
  TestCompareUsesIntegerOrder();
  TestParseBumpKind();

  std::cout << "model_registry_unit_version_allocator: pass\n";
  return 0;
}
