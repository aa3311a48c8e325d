#pragma once

#include "mycelic/types.hpp"

#include <mutex>
#include <string>

namespace mycelic {

// Server-side timestamp source. Successive calls on one instance never go
// backwards, even if the wall clock does.
class MonotonicClock {
 public:
  Timestamp Now();

 private:
  std::mutex mutex_{};
  Timestamp last_{};
};

// ISO-8601 UTC with microseconds: 2026-10-19T17:52:00.123456Z
std::string FormatTimestamp(Timestamp ts);
Timestamp ParseTimestamp(const std::string& text);

// Random RFC 4122 version 4 identifier.
std::string NewId();

}  // namespace mycelic
