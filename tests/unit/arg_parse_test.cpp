#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/arg_parse.hpp"

namespace {

using modelreg::util::ParseDouble;
using modelreg::util::ParseUnsigned;

template <typename Fn>
bool RejectsArgument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestKeepCountAboveUint32IsRejected() {
  assert(ParseUnsigned<uint32_t>("4294967295", "keep_last_n") == 4294967295u);
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("4294967296", "keep_last_n"); }));
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("4294967297", "keep_last_n"); }));
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("4294967298", "feature count"); }));
}

void TestSampleCountUsesFullRange() {
  assert(ParseUnsigned<uint64_t>("4294967297", "sample count") == 4294967297ull);
  assert(ParseUnsigned<uint64_t>("18446744073709551615", "sample count") == UINT64_MAX);
  assert(RejectsArgument([] { ParseUnsigned<uint64_t>("18446744073709551616", "sample count"); }));
}

void TestMalformedNumbersAreRejected() {
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("", "keep_last_n"); }));
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("-1", "keep_last_n"); }));
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("3 ", "keep_last_n"); }));
  assert(RejectsArgument([] { ParseUnsigned<uint32_t>("0x10", "keep_last_n"); }));
}

void TestDoubles() {
  assert(ParseDouble("0.25", "metric value") == 0.25);
  assert(ParseDouble("-3", "metric value") == -3.0);
  assert(RejectsArgument([] { ParseDouble("0.9x", "metric value"); }));
  assert(RejectsArgument([] { ParseDouble("", "metric value"); }));
  assert(RejectsArgument([] { ParseDouble("1e999", "duration"); }));
}

} // namespace

int main() {
  TestKeepCountAboveUint32IsRejected();
  TestSampleCountUsesFullRange();
  TestMalformedNumbersAreRejected();
  TestDoubles();

  std::cout << "model_registry_unit_arg_parse: pass\n";
  return 0;
}
