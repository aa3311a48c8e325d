#include "mycelic/config.hpp"

#include "mycelic/errors.hpp"

#include <cstdlib>
#include <exception>
#include <limits>
#include <optional>
#include <string>

namespace mycelic {
namespace {

std::optional<std::string> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

long long ParsePositive(const char* name, const std::string& text) {
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw ValidationError(std::string(name) + " is not a number: " + text);
  }
  if (consumed != text.size() || value <= 0) {
    throw ValidationError(std::string(name) + " must be a positive integer: " + text);
  }
  return value;
}

}  // namespace

EngineConfig LoadEngineConfigFromEnvironment(EngineConfig base) {
  if (const auto path = ReadEnv("MYCELIC_DB_PATH")) {
    base.database.path = *path;
  }
  if (const auto level = ReadEnv("MYCELIC_LOG_LEVEL")) {
    base.logging.level = *level;
  }
  if (const auto timeout = ReadEnv("MYCELIC_EMBED_TIMEOUT_MS")) {
    base.embedding.timeout = std::chrono::milliseconds(ParsePositive("MYCELIC_EMBED_TIMEOUT_MS", *timeout));
  }
  if (const auto pool = ReadEnv("MYCELIC_POOL_SIZE")) {
    const auto size = ParsePositive("MYCELIC_POOL_SIZE", *pool);
    if (size > std::numeric_limits<int>::max()) {
      throw ValidationError("MYCELIC_POOL_SIZE out of range: " + *pool);
    }
    base.database.pool_size = static_cast<int>(size);
  }
  return base;
}

void ValidateEngineConfig(const EngineConfig& config) {
  if (config.database.path.empty()) {
    throw ValidationError("database path is required");
  }
  if (config.database.pool_size <= 0) {
    throw ValidationError("database pool size must be positive");
  }
  if (config.database.busy_timeout.count() < 0) {
    throw ValidationError("busy timeout must not be negative");
  }
  if (config.search.default_limit <= 0 || config.search.max_limit < config.search.default_limit) {
    throw ValidationError("search limits are inconsistent");
  }
  if (config.search.filter_overfetch < 1) {
    throw ValidationError("filter overfetch must be at least 1");
  }
  if (!(config.search.hybrid_alpha >= 0.0f && config.search.hybrid_alpha <= 1.0f)) {
    throw ValidationError("hybrid alpha must be within [0, 1]");
  }
  if (config.search.rrf_k <= 0) {
    throw ValidationError("rrf_k must be positive");
  }
  if (!(config.search.min_similarity >= 0.0 && config.search.min_similarity <= 1.0)) {
    throw ValidationError("min similarity must be within [0, 1]");
  }
  if (config.graph.default_depth < 0 || config.graph.max_depth < config.graph.default_depth) {
    throw ValidationError("graph depth limits are inconsistent");
  }
  if (config.graph.find_related_limit <= 0 || config.graph.discovery_candidate_limit <= 0) {
    throw ValidationError("graph limits must be positive");
  }
  if (config.embedding.timeout.count() <= 0) {
    throw ValidationError("embedding timeout must be positive");
  }
  if (config.chunking.max_chunk_size <= 0 || config.chunking.min_chunk_size < 0) {
    throw ValidationError("chunk sizes must be positive");
  }
  if (config.chunking.overlap_size < 0 || config.chunking.overlap_size >= config.chunking.max_chunk_size) {
    throw ValidationError("chunk overlap must be within [0, max chunk size)");
  }
}

}  // namespace mycelic
