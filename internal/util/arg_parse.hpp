#pragma once

#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace modelreg::util {

/*
  Command line number parsing. Whole-string matches only; anything else,
  including a value that does not fit in T, is std::invalid_argument.
*/
template <typename T>
T ParseUnsigned(const std::string& value, const std::string& what) {
  static_assert(std::is_unsigned_v<T>, "ParseUnsigned needs an unsigned type");

  uint64_t   parsed = 0;
  const auto end    = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    throw std::invalid_argument("invalid " + what + ": '" + value + "'");
  }
  if (parsed > std::numeric_limits<T>::max()) {
    throw std::invalid_argument(what + " out of range: '" + value + "'");
  }
  return static_cast<T>(parsed);
}

double ParseDouble(const std::string& value, const std::string& what);

} // namespace modelreg::util
