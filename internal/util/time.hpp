#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace jwlmerge::util {

/*
  Time utilities: single place to control clock source and the
  timestamp formats written into manifests.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Parses YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]. No zone means UTC.
std::optional<TimePoint> ParseIso8601(const std::string& text);

// Local time with numeric offset, e.g. 2026-10-18T14:03:11+02:00
std::string FormatLocalIso8601(TimePoint tp);

// merged_YYYY-MM-DD_HH-MM-SS in local time
std::string MergedBackupName(TimePoint tp);

// YYYYmmdd_HHMMSS in local time, for file names
std::string CompactLocalStamp(TimePoint tp);

} // namespace jwlmerge::util
