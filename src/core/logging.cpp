#include "mycelic/logging.hpp"

#include "mycelic/errors.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mycelic {
namespace {

std::mutex g_registry_mutex;
std::vector<std::string> g_component_names;
spdlog::level::level_enum g_level = spdlog::level::info;

// spdlog maps unknown names to off, so only a literal "off" may mean off.
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& text) {
  const auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger(const std::string& component) {
  const auto name = "mycelic." + component;
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  if (auto existing = spdlog::get(name); existing != nullptr) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(name);
  logger->set_level(g_level);
  g_component_names.push_back(name);
  return logger;
}

void ConfigureLogging(const LoggingConfig& config) {
  const auto level = ParseLevel(config.level);
  if (!level.has_value()) {
    throw ValidationError("unknown log level: " + config.level);
  }
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  g_level = *level;
  for (const auto& name : g_component_names) {
    if (auto logger = spdlog::get(name); logger != nullptr) {
      logger->set_level(g_level);
    }
  }
}

}  // namespace mycelic
