#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace mycelic {

struct DatabaseConfig {
  std::filesystem::path path;
  int pool_size = 4;
  std::chrono::milliseconds busy_timeout{5000};
  bool enable_wal = true;
};

struct SearchConfig {
  int default_limit = 10;
  int max_limit = 1000;
  int filter_overfetch = 5;
  float hybrid_alpha = 0.5f;
  int rrf_k = 60;
  double min_similarity = 0.0;
};

struct GraphConfig {
  int default_depth = 2;
  int max_depth = 5;
  int find_related_limit = 10;
  int discovery_candidate_limit = 200;
};

struct EmbeddingConfig {
  std::chrono::milliseconds timeout{30000};
  std::string model = "unknown";
};

// Sizes are in bytes of UTF-8 content.
struct ChunkingConfig {
  bool enabled = true;
  // Content longer than this is stored with child chunks.
  int min_chunk_size = 1500;
  int max_chunk_size = 1000;
  // Tail of one chunk repeated at the head of the next.
  int overlap_size = 100;
};

struct LoggingConfig {
  std::string level = "info";
};

struct EngineConfig {
  DatabaseConfig database{};
  SearchConfig search{};
  GraphConfig graph{};
  EmbeddingConfig embedding{};
  ChunkingConfig chunking{};
  LoggingConfig logging{};
};

// Overlays MYCELIC_DB_PATH, MYCELIC_LOG_LEVEL, MYCELIC_EMBED_TIMEOUT_MS and
// MYCELIC_POOL_SIZE on top of base.
EngineConfig LoadEngineConfigFromEnvironment(EngineConfig base = {});

void ValidateEngineConfig(const EngineConfig& config);

}  // namespace mycelic
