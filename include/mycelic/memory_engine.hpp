#pragma once

#include "mycelic/cancellation.hpp"
#include "mycelic/config.hpp"
#include "mycelic/embeddings.hpp"
#include "mycelic/memory_store.hpp"
#include "mycelic/relationship_graph.hpp"
#include "mycelic/schema.hpp"
#include "mycelic/search.hpp"
#include "mycelic/session_store.hpp"
#include "mycelic/stats.hpp"
#include "mycelic/taxonomy_store.hpp"
#include "mycelic/types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mycelic {

class Database;

// The single API surface shared by every caller. Methods may be called from
// many threads at once; each runs in its own transaction on a pooled
// connection.
class MemoryEngine {
 public:
  // A null provider leaves semantic search and discovery unavailable.
  static std::unique_ptr<MemoryEngine> Open(const EngineConfig& config,
                                            std::shared_ptr<EmbeddingProvider> embedding_provider = nullptr);
  ~MemoryEngine();

  MemoryEngine(const MemoryEngine&) = delete;
  MemoryEngine& operator=(const MemoryEngine&) = delete;

  Memory CreateMemory(const CreateMemoryRequest& request);
  Memory GetMemory(const std::string& id);
  Memory GetMemoryBySlug(const std::string& slug);
  Memory UpdateMemory(const std::string& id, const MemoryUpdate& update);
  void DeleteMemory(const std::string& id);
  std::vector<Memory> ListMemories(const ListMemoriesFilter& filter = {});
  std::vector<Memory> GetChunks(const std::string& parent_id);
  int BackfillEmbeddings(int limit = 100);

  std::vector<ScoredResult> Search(const SearchRequest& request);

  Relationship CreateRelationship(const CreateRelationshipRequest& request);
  std::vector<Relationship> GetRelationships(const std::string& memory_id);
  std::vector<Relationship> GetRelationshipsBetween(const std::string& first_id, const std::string& second_id);
  std::vector<RelatedMemory> FindRelated(const std::string& memory_id, const FindRelatedOptions& options = {});
  Graph MapGraph(const std::string& root_id,
                 std::optional<int> depth = std::nullopt,
                 const CancellationToken& token = {});
  std::vector<Relationship> DiscoverRelationships(const DiscoveryOptions& options = {},
                                                  const CancellationToken& token = {});

  Category CreateCategory(const CreateCategoryRequest& request);
  Category GetCategory(const std::string& id);
  std::vector<Category> ListCategories(const CategoryFilter& filter = {});
  void DeleteCategory(const std::string& id);
  Categorization Categorize(const std::string& memory_id,
                            const std::string& category_id,
                            double confidence,
                            const std::optional<std::string>& reasoning = std::nullopt);
  void Uncategorize(const std::string& memory_id, const std::string& category_id);
  std::vector<Categorization> CategoriesForMemory(const std::string& memory_id);
  std::vector<Memory> MemoriesInCategory(const std::string& category_id, int limit = 50, int offset = 0);

  Domain CreateDomain(const std::string& name, const std::optional<std::string>& description = std::nullopt);
  Domain GetDomain(const std::string& name_or_id);
  std::vector<Domain> ListDomains();
  void DeleteDomain(const std::string& name_or_id);

  Session GetSession(const std::string& session_id);
  std::vector<Session> ListSessions(bool active_only = false);
  Session DeactivateSession(const std::string& session_id);

  StatsSnapshot Stats();
  int SchemaVersion();
  std::vector<AppliedMigration> AppliedMigrations();
  void CheckKeywordIndex();
  void RebuildKeywordIndex();

  [[nodiscard]] bool semantic_available() const;

  // Idempotent. Calls made after Close throw.
  void Close();

 private:
  MemoryEngine(const EngineConfig& config,
               std::unique_ptr<Database> db,
               std::shared_ptr<EmbeddingProvider> embedding_provider);

  void ThrowIfClosed() const;

  std::unique_ptr<Database> db_;
  EmbeddingGateway embeddings_;
  MemoryStore memories_;
  SearchDispatcher search_;
  RelationshipGraph graph_;
  TaxonomyStore taxonomy_;
  SessionStore sessions_;
  StatsAggregator stats_;
  std::atomic<bool> closed_{false};
};

}  // namespace mycelic
