#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace mycelic::tests {

inline bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

// MYCELIC_TEST_LOG overrides the build default (on unless NDEBUG).
inline bool LoggingEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    constexpr bool kDefault = false;
#else
    constexpr bool kDefault = true;
#endif
    const char* env = std::getenv("MYCELIC_TEST_LOG");
    if (env == nullptr) {
      return kDefault;
    }
    return IsTruthy(env);
  }();
  return enabled;
}

inline void Log(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[mycelic-test] " << message << "\n";
}

inline void LogError(std::string_view message) {
  // Failures are always reported.
  std::cerr << "[mycelic-test] ERROR: " << message << "\n";
}

inline void LogKV(std::string_view key, std::string_view value) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[mycelic-test] " << key << "=" << value << "\n";
}

inline void LogKV(std::string_view key, const std::string& value) {
  LogKV(key, std::string_view(value));
}

inline void LogKV(std::string_view key, const char* value) {
  LogKV(key, std::string_view(value != nullptr ? value : "(null)"));
}

inline void LogKV(std::string_view key, std::uint64_t value) {
  LogKV(key, std::to_string(value));
}

inline void LogKV(std::string_view key, double value) {
  LogKV(key, std::to_string(value));
}

inline void LogKV(std::string_view key, bool value) {
  LogKV(key, std::string_view(value ? "true" : "false"));
}

}  // namespace mycelic::tests
