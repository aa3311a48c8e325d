#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mycelic {

using Timestamp = std::chrono::system_clock::time_point;

enum class AgentType {
  kDesktopAgent,
  kCodeAgent,
  kApiCaller,
  kUnknown,
};

enum class RelationshipType {
  kReferences,
  kContradicts,
  kExpands,
  kSimilar,
  kSequential,
  kCauses,
  kEnables,
};

const char* ToString(AgentType type);
const char* ToString(RelationshipType type);
AgentType ParseAgentType(const std::string& text);
RelationshipType ParseRelationshipType(const std::string& text);

inline constexpr int kMinImportance = 1;
inline constexpr int kMaxImportance = 10;
inline constexpr int kDefaultImportance = 5;
inline constexpr double kDefaultConfidenceThreshold = 0.7;
inline constexpr const char* kDefaultAccessScope = "session";

struct Memory {
  std::string id;
  std::string content;
  int importance = kDefaultImportance;
  std::vector<std::string> tags;
  std::optional<std::string> domain;
  std::optional<std::string> source;
  std::string session_id;
  std::optional<std::vector<float>> embedding;
  Timestamp created_at{};
  Timestamp updated_at{};
  AgentType agent_type = AgentType::kUnknown;
  std::optional<std::string> agent_context;
  std::string access_scope = kDefaultAccessScope;
  std::optional<std::string> slug;
  // Set on chunks; names the memory holding the full content.
  std::optional<std::string> parent_memory_id;
  int chunk_level = 0;
  int chunk_index = 0;
};

struct CreateMemoryRequest {
  std::string content;
  std::optional<int> importance;
  std::vector<std::string> tags;
  std::optional<std::string> domain;
  std::optional<std::string> source;
  std::string session_id;
  AgentType agent_type = AgentType::kUnknown;
  std::optional<std::string> agent_context;
  std::optional<std::string> access_scope;
  std::optional<std::string> slug;
};

// Unset fields are left untouched.
struct MemoryUpdate {
  std::optional<std::string> content;
  std::optional<int> importance;
  std::optional<std::vector<std::string>> tags;
  std::optional<std::string> source;
  std::optional<std::string> domain;

  [[nodiscard]] bool empty() const {
    return !content.has_value() && !importance.has_value() && !tags.has_value() && !source.has_value() &&
           !domain.has_value();
  }
};

struct ListMemoriesFilter {
  std::optional<std::string> domain;
  std::optional<std::string> session_id;
  std::optional<int> min_importance;
  std::optional<int> max_importance;
  // Chunks are listed only on request; their parents carry the full text.
  bool include_chunks = false;
  int limit = 50;
  int offset = 0;
};

struct Relationship {
  std::string id;
  std::string source_memory_id;
  std::string target_memory_id;
  RelationshipType type = RelationshipType::kReferences;
  double strength = 0.0;
  std::optional<std::string> context;
  bool auto_generated = false;
  Timestamp created_at{};
};

struct CreateRelationshipRequest {
  std::string source_memory_id;
  std::string target_memory_id;
  RelationshipType type = RelationshipType::kReferences;
  double strength = 0.5;
  std::optional<std::string> context;
};

struct FindRelatedOptions {
  std::optional<double> min_strength;
  std::optional<RelationshipType> type;
  std::optional<int> limit;
};

struct RelatedMemory {
  Memory memory;
  Relationship relationship;
};

struct GraphNode {
  std::string id;
  int distance = 0;
  int importance = kDefaultImportance;
  std::string content;
};

struct GraphEdge {
  std::string source_id;
  std::string target_id;
  RelationshipType type = RelationshipType::kReferences;
  double strength = 0.0;
};

struct Graph {
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;
  int depth = 0;
  bool truncated = false;
};

struct DiscoveryOptions {
  int limit = 10;
  double min_strength = 0.7;
};

struct Category {
  std::string id;
  std::string name;
  std::string description;
  std::optional<std::string> parent_category_id;
  double confidence_threshold = kDefaultConfidenceThreshold;
  bool auto_generated = false;
  Timestamp created_at{};
};

struct CreateCategoryRequest {
  std::string name;
  std::string description;
  std::optional<std::string> parent_category_id;
  std::optional<double> confidence_threshold;
  bool auto_generated = false;
};

struct CategoryFilter {
  std::optional<std::string> parent_category_id;
  bool roots_only = false;
  std::optional<bool> auto_generated;
};

struct Categorization {
  std::string memory_id;
  std::string category_id;
  double confidence = 0.0;
  std::optional<std::string> reasoning;
  Timestamp created_at{};
};

struct Domain {
  std::string id;
  std::string name;
  std::optional<std::string> description;
  Timestamp created_at{};
  Timestamp updated_at{};
};

struct Session {
  std::string session_id;
  AgentType agent_type = AgentType::kUnknown;
  std::optional<std::string> agent_context;
  Timestamp created_at{};
  Timestamp last_accessed{};
  bool is_active = true;
};

struct VectorMetadata {
  std::string memory_id;
  std::int64_t vector_index = 0;
  std::string embedding_model;
  int embedding_dimension = 0;
  Timestamp last_updated{};
};

struct DomainCount {
  std::string domain;
  std::uint64_t memory_count = 0;
  double average_importance = 0.0;
};

struct CategoryCount {
  std::string category_id;
  std::string name;
  std::uint64_t memory_count = 0;
};

struct StatsSnapshot {
  // Every stored row; chunk_count of them are chunks of longer memories.
  std::uint64_t memory_count = 0;
  std::uint64_t chunk_count = 0;
  std::optional<double> average_importance;
  std::vector<std::string> distinct_tags;
  std::optional<Timestamp> earliest_created_at;
  std::optional<Timestamp> latest_created_at;
  std::vector<DomainCount> domains;
  std::vector<CategoryCount> categories;
  std::uint64_t relationship_count = 0;
  std::uint64_t auto_generated_relationship_count = 0;
  std::uint64_t session_count = 0;
  std::uint64_t active_session_count = 0;
  std::uint64_t vector_count = 0;
  int schema_version = 0;
};

}  // namespace mycelic
