#pragma once

#include "mycelic/config.hpp"
#include "mycelic/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mycelic {

class Connection;
class Database;
class EmbeddingGateway;
class Statement;

// Trimmed, lower-cased, de-duplicated in first-seen order, empties dropped.
// Control characters are a ValidationError.
std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags);
void ValidateImportance(int importance);

// Row access shared by the search, graph and taxonomy modules. Selects from
// memories aliased as m; ReadMemoryRow decodes those columns starting at
// first_column.
extern const char* const kMemoryColumns;
Memory ReadMemoryRow(const Statement& stmt, int first_column = 0);
std::optional<Memory> LoadMemory(Connection& conn, const std::string& id);
// Found memories in the order of ids; unknown ids are skipped.
std::vector<Memory> LoadMemories(Connection& conn, const std::vector<std::string>& ids);
[[nodiscard]] bool MemoryExists(Connection& conn, const std::string& id);

class MemoryStore {
 public:
  MemoryStore(Database& db, const EmbeddingGateway& embeddings, ChunkingConfig chunking = {});

  // Long content is stored whole plus one child memory per chunk, all in
  // one transaction. Returns the parent.
  Memory Create(const CreateMemoryRequest& request);
  Memory Get(const std::string& id);
  Memory GetBySlug(const std::string& slug);
  Memory Update(const std::string& id, const MemoryUpdate& update);
  void Delete(const std::string& id);
  std::vector<Memory> List(const ListMemoriesFilter& filter);
  // Children of parent_id in chunk order.
  std::vector<Memory> GetChunks(const std::string& parent_id);

  // Embeds up to limit memories that have no vector yet; returns how many
  // were indexed.
  int BackfillEmbeddings(int limit);

 private:
  std::optional<std::vector<float>> TryEmbed(const std::string& text) const;
  // Chunk content and, when embed is set, chunk vectors. Ids and inherited
  // fields are filled in by InsertChunks.
  std::vector<Memory> PrepareChunks(const std::string& content, bool embed) const;

  Database& db_;
  const EmbeddingGateway& embeddings_;
  ChunkingConfig chunking_;
};

}  // namespace mycelic
