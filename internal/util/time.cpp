#include "time.hpp"

#include <cctype>

namespace gemfeed::util {

namespace {

bool ParseDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  out = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    out = out * 10 + (text[i] - '0');
  }
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<std::string> NormalizeTimestamp(std::string_view text) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year = 0, month = 0, day = 0;
  if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, month) || !ParseDigits(text, 8, 2, day)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                         std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  std::string canonical(text.substr(0, 10));
  if (text.size() == 10) {
    return canonical;
  }
  if (text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  auto time = text.substr(11);
  if (!time.empty() && time.back() == 'Z') {
    time.remove_suffix(1);
  }
  if (time.size() != 5 && time.size() != 8) {
    return std::nullopt;
  }

  int hour = 0, minute = 0, second = 0;
  if (time[2] != ':' || !ParseDigits(time, 0, 2, hour) || !ParseDigits(time, 3, 2, minute)) {
    return std::nullopt;
  }
  if (time.size() == 8 && (time[5] != ':' || !ParseDigits(time, 6, 2, second))) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  canonical += 'T';
  canonical += time.substr(0, 5);
  canonical += time.size() == 8 ? time.substr(5, 3) : std::string_view(":00");
  return canonical;
}

} // namespace gemfeed::util
