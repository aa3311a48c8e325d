#include "mycelic/clock.hpp"

#include "mycelic/errors.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace mycelic {

Timestamp MonotonicClock::Now() {
  using std::chrono::microseconds;
  const auto wall = std::chrono::time_point_cast<microseconds>(std::chrono::system_clock::now());
  std::lock_guard<std::mutex> lock(mutex_);
  Timestamp next = wall;
  if (next <= last_) {
    next = last_ + microseconds(1);
  }
  last_ = next;
  return next;
}

std::string FormatTimestamp(Timestamp ts) {
  using namespace std::chrono;
  const auto micros = time_point_cast<microseconds>(ts);
  const auto day_point = floor<days>(micros);
  const year_month_day ymd{day_point};
  const auto since_midnight = micros - day_point;
  const auto h = duration_cast<hours>(since_midnight);
  const auto m = duration_cast<minutes>(since_midnight - h);
  const auto s = duration_cast<seconds>(since_midnight - h - m);
  const auto us = since_midnight - h - m - s;

  std::array<char, 40> buffer{};
  std::snprintf(buffer.data(),
                buffer.size(),
                "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()),
                static_cast<int>(h.count()),
                static_cast<int>(m.count()),
                static_cast<int>(s.count()),
                static_cast<long long>(us.count()));
  return std::string(buffer.data());
}

Timestamp ParseTimestamp(const std::string& text) {
  using namespace std::chrono;
  int y = 0;
  unsigned mo = 0;
  unsigned d = 0;
  int h = 0;
  int mi = 0;
  int s = 0;
  long long us = 0;
  int consumed = 0;
  const int fields =
      std::sscanf(text.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d.%6lldZ%n", &y, &mo, &d, &h, &mi, &s, &us, &consumed);
  if (fields != 7 || static_cast<std::size_t>(consumed) != text.size()) {
    throw InternalError("malformed stored timestamp: " + text);
  }
  const year_month_day ymd{year{y}, month{mo}, day{d}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
    throw InternalError("malformed stored timestamp: " + text);
  }
  return Timestamp{sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + microseconds{us}};
}

std::string NewId() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<std::uint64_t> dist{};
  std::uint64_t hi = dist(engine);
  std::uint64_t lo = dist(engine);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::array<char, 37> buffer{};
  std::snprintf(buffer.data(),
                buffer.size(),
                "%08llx-%04llx-%04llx-%04llx-%012llx",
                static_cast<unsigned long long>(hi >> 32U),
                static_cast<unsigned long long>((hi >> 16U) & 0xFFFFULL),
                static_cast<unsigned long long>(hi & 0xFFFFULL),
                static_cast<unsigned long long>(lo >> 48U),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buffer.data());
}

}  // namespace mycelic
