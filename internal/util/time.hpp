#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gemfeed::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Returns the canonical form of a publication timestamp, or nullopt when
// the text is not one. Accepted: "YYYY-MM-DD", or the date followed by 'T'
// or ' ', "HH:MM" or "HH:MM:SS", and an optional trailing 'Z'. A timestamp
// with a time part is canonicalized to "YYYY-MM-DDTHH:MM:SS" so that
// canonical values order chronologically as plain strings.
std::optional<std::string> NormalizeTimestamp(std::string_view text);

} // namespace gemfeed::util
