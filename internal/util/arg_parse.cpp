#include "arg_parse.hpp"

namespace modelreg::util {

double ParseDouble(const std::string& value, const std::string& what) {
  std::size_t consumed = 0;
  double      parsed   = 0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("invalid " + what + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("invalid " + what + ": '" + value + "'");
  }
  return parsed;
}

} // namespace modelreg::util
