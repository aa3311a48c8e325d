#include "mycelic/memory_engine.hpp"

#include "mycelic/errors.hpp"
#include "mycelic/keyword_index.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/sqlite_database.hpp"

#include <utility>

namespace mycelic {
namespace {

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("engine");
  return logger;
}

}  // namespace

std::unique_ptr<MemoryEngine> MemoryEngine::Open(const EngineConfig& config,
                                                 std::shared_ptr<EmbeddingProvider> embedding_provider) {
  ValidateEngineConfig(config);
  ConfigureLogging(config.logging);
  if (embedding_provider == nullptr) {
    embedding_provider = std::make_shared<UnavailableEmbeddingProvider>();
  }
  auto db = Database::Open(config.database);
  std::unique_ptr<MemoryEngine> engine(new MemoryEngine(config, std::move(db), std::move(embedding_provider)));
  Log()->info("memory engine ready on {} (semantic search {})",
              config.database.path.string(),
              engine->semantic_available() ? "enabled" : "unavailable");
  return engine;
}

MemoryEngine::MemoryEngine(const EngineConfig& config,
                           std::unique_ptr<Database> db,
                           std::shared_ptr<EmbeddingProvider> embedding_provider)
    : db_(std::move(db)),
      embeddings_(std::move(embedding_provider), config.embedding),
      memories_(*db_, embeddings_, config.chunking),
      search_(*db_, embeddings_, config.search),
      graph_(*db_, embeddings_, config.graph),
      taxonomy_(*db_),
      sessions_(*db_),
      stats_(*db_) {}

MemoryEngine::~MemoryEngine() {
  Close();
}

void MemoryEngine::ThrowIfClosed() const {
  if (closed_.load(std::memory_order_acquire)) {
    throw InternalError("memory engine is closed");
  }
}

Memory MemoryEngine::CreateMemory(const CreateMemoryRequest& request) {
  ThrowIfClosed();
  return memories_.Create(request);
}

Memory MemoryEngine::GetMemory(const std::string& id) {
  ThrowIfClosed();
  return memories_.Get(id);
}

Memory MemoryEngine::GetMemoryBySlug(const std::string& slug) {
  ThrowIfClosed();
  return memories_.GetBySlug(slug);
}

Memory MemoryEngine::UpdateMemory(const std::string& id, const MemoryUpdate& update) {
  ThrowIfClosed();
  return memories_.Update(id, update);
}

void MemoryEngine::DeleteMemory(const std::string& id) {
  ThrowIfClosed();
  memories_.Delete(id);
}

std::vector<Memory> MemoryEngine::ListMemories(const ListMemoriesFilter& filter) {
  ThrowIfClosed();
  return memories_.List(filter);
}

std::vector<Memory> MemoryEngine::GetChunks(const std::string& parent_id) {
  ThrowIfClosed();
  return memories_.GetChunks(parent_id);
}

int MemoryEngine::BackfillEmbeddings(int limit) {
  ThrowIfClosed();
  return memories_.BackfillEmbeddings(limit);
}

std::vector<ScoredResult> MemoryEngine::Search(const SearchRequest& request) {
  ThrowIfClosed();
  return search_.Search(request);
}

Relationship MemoryEngine::CreateRelationship(const CreateRelationshipRequest& request) {
  ThrowIfClosed();
  return graph_.CreateRelationship(request);
}

std::vector<Relationship> MemoryEngine::GetRelationships(const std::string& memory_id) {
  ThrowIfClosed();
  return graph_.GetRelationshipsForMemory(memory_id);
}

std::vector<Relationship> MemoryEngine::GetRelationshipsBetween(const std::string& first_id,
                                                                const std::string& second_id) {
  ThrowIfClosed();
  return graph_.GetRelationshipsBetween(first_id, second_id);
}

std::vector<RelatedMemory> MemoryEngine::FindRelated(const std::string& memory_id, const FindRelatedOptions& options) {
  ThrowIfClosed();
  return graph_.FindRelated(memory_id, options);
}

Graph MemoryEngine::MapGraph(const std::string& root_id, std::optional<int> depth, const CancellationToken& token) {
  ThrowIfClosed();
  return graph_.MapGraph(root_id, depth, token);
}

std::vector<Relationship> MemoryEngine::DiscoverRelationships(const DiscoveryOptions& options,
                                                              const CancellationToken& token) {
  ThrowIfClosed();
  return graph_.DiscoverRelationships(options, token);
}

Category MemoryEngine::CreateCategory(const CreateCategoryRequest& request) {
  ThrowIfClosed();
  return taxonomy_.CreateCategory(request);
}

Category MemoryEngine::GetCategory(const std::string& id) {
  ThrowIfClosed();
  return taxonomy_.GetCategory(id);
}

std::vector<Category> MemoryEngine::ListCategories(const CategoryFilter& filter) {
  ThrowIfClosed();
  return taxonomy_.ListCategories(filter);
}

void MemoryEngine::DeleteCategory(const std::string& id) {
  ThrowIfClosed();
  taxonomy_.DeleteCategory(id);
}

Categorization MemoryEngine::Categorize(const std::string& memory_id,
                                        const std::string& category_id,
                                        double confidence,
                                        const std::optional<std::string>& reasoning) {
  ThrowIfClosed();
  return taxonomy_.Categorize(memory_id, category_id, confidence, reasoning);
}

void MemoryEngine::Uncategorize(const std::string& memory_id, const std::string& category_id) {
  ThrowIfClosed();
  taxonomy_.Uncategorize(memory_id, category_id);
}

std::vector<Categorization> MemoryEngine::CategoriesForMemory(const std::string& memory_id) {
  ThrowIfClosed();
  return taxonomy_.CategoriesForMemory(memory_id);
}

std::vector<Memory> MemoryEngine::MemoriesInCategory(const std::string& category_id, int limit, int offset) {
  ThrowIfClosed();
  return taxonomy_.MemoriesInCategory(category_id, limit, offset);
}

Domain MemoryEngine::CreateDomain(const std::string& name, const std::optional<std::string>& description) {
  ThrowIfClosed();
  return taxonomy_.CreateDomain(name, description);
}

Domain MemoryEngine::GetDomain(const std::string& name_or_id) {
  ThrowIfClosed();
  return taxonomy_.GetDomain(name_or_id);
}

std::vector<Domain> MemoryEngine::ListDomains() {
  ThrowIfClosed();
  return taxonomy_.ListDomains();
}

void MemoryEngine::DeleteDomain(const std::string& name_or_id) {
  ThrowIfClosed();
  taxonomy_.DeleteDomain(name_or_id);
}

Session MemoryEngine::GetSession(const std::string& session_id) {
  ThrowIfClosed();
  return sessions_.Get(session_id);
}

std::vector<Session> MemoryEngine::ListSessions(bool active_only) {
  ThrowIfClosed();
  return sessions_.List(active_only);
}

Session MemoryEngine::DeactivateSession(const std::string& session_id) {
  ThrowIfClosed();
  return sessions_.Deactivate(session_id);
}

StatsSnapshot MemoryEngine::Stats() {
  ThrowIfClosed();
  return stats_.Collect();
}

int MemoryEngine::SchemaVersion() {
  ThrowIfClosed();
  return db_->Read([](Connection& conn) { return mycelic::SchemaVersion(conn); });
}

std::vector<AppliedMigration> MemoryEngine::AppliedMigrations() {
  ThrowIfClosed();
  return db_->Read([](Connection& conn) { return mycelic::AppliedMigrations(conn); });
}

void MemoryEngine::CheckKeywordIndex() {
  ThrowIfClosed();
  // The FTS5 command is an INSERT, so it needs the write lock.
  db_->Write([](Connection& conn) { mycelic::CheckKeywordIndex(conn); });
}

void MemoryEngine::RebuildKeywordIndex() {
  ThrowIfClosed();
  db_->Write([](Connection& conn) { mycelic::RebuildKeywordIndex(conn); });
  Log()->info("rebuilt keyword index");
}

bool MemoryEngine::semantic_available() const {
  return embeddings_.available();
}

void MemoryEngine::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  db_->Close();
}

}  // namespace mycelic
