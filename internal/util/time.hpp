#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace modelreg::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339, UTC ("2026-10-19T08:15:02.125Z").
std::string ToRfc3339(const google::protobuf::Timestamp& ts);

// Whole days from `from` to `to`, floored (one hour back is -1).
int64_t DaysBetween(const google::protobuf::Timestamp& from, const google::protobuf::Timestamp& to);

} // namespace modelreg::util
