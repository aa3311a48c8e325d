#pragma once

#include "mycelic/config.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mycelic {

// Returns the shared logger for a component ("database", "memory", ...),
// creating it on first use.
std::shared_ptr<spdlog::logger> GetLogger(const std::string& component);

void ConfigureLogging(const LoggingConfig& config);

}  // namespace mycelic
