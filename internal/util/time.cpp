#include "time.hpp"

#include <cctype>
#include <ctime>

namespace jwlmerge::util {

namespace {

bool ReadDigits(const std::string& s, std::size_t& pos, std::size_t count, int* out) {
  if (pos + count > s.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  *out = value;
  return true;
}

bool Expect(const std::string& s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

std::tm LocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  localtime_r(&t, &tm);
  return tm;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  std::size_t pos = 0;
  int         year, month, day, hour, minute, second;
  if (!ReadDigits(text, pos, 4, &year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, &month) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, &day)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) return std::nullopt;
  ++pos;
  if (!ReadDigits(text, pos, 2, &hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, &minute) || !Expect(text, pos, ':') ||
      !ReadDigits(text, pos, 2, &second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) return std::nullopt;

  std::chrono::nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long long   nanos  = 0;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (std::size_t i = digits; i < 9; ++i) nanos *= 10;
    fraction = std::chrono::nanoseconds(nanos);
  }

  int offset_seconds = 0;
  if (pos < text.size()) {
    const char zone = text[pos++];
    if (zone == 'Z' || zone == 'z') {
      // UTC
    } else if (zone == '+' || zone == '-') {
      int oh, om;
      if (!ReadDigits(text, pos, 2, &oh)) return std::nullopt;
      Expect(text, pos, ':');
      if (!ReadDigits(text, pos, 2, &om)) return std::nullopt;
      offset_seconds = (oh * 3600 + om * 60) * (zone == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t utc = timegm(&tm);
  auto              tp  = Clock::from_time_t(utc) - std::chrono::seconds(offset_seconds);
  return tp + std::chrono::duration_cast<Clock::duration>(fraction);
}

std::string FormatLocalIso8601(TimePoint tp) {
  const std::tm tm = LocalTm(tp);

  char base[32];
  std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

  // %z yields +hhmm; manifests use +hh:mm
  char zone[8];
  std::strftime(zone, sizeof(zone), "%z", &tm);
  std::string offset(zone);
  if (offset.size() == 5) {
    offset.insert(3, ":");
  }
  return std::string(base) + offset;
}

std::string MergedBackupName(TimePoint tp) {
  const std::tm tm = LocalTm(tp);
  char          buf[40];
  std::strftime(buf, sizeof(buf), "merged_%Y-%m-%d_%H-%M-%S", &tm);
  return buf;
}

std::string CompactLocalStamp(TimePoint tp) {
  const std::tm tm = LocalTm(tp);
  char          buf[24];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

} // namespace jwlmerge::util
