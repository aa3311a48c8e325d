#include "mycelic/memory_store.hpp"

#include "mycelic/chunker.hpp"
#include "mycelic/clock.hpp"
#include "mycelic/embeddings.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/session_store.hpp"
#include "mycelic/sqlite_database.hpp"
#include "mycelic/taxonomy_store.hpp"
#include "mycelic/text.hpp"
#include "mycelic/vector_index.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mycelic {

const char* const kMemoryColumns =
    "m.id, m.content, m.importance, "
    "m.tags, "
    "m.domain, m.source, m.session_id, m.embedding, m.created_at, m.updated_at, "
    "m.agent_type, m.agent_context, m.access_scope, m.slug, "
    "m.parent_memory_id, m.chunk_level, m.chunk_index";

namespace {

constexpr int kMaxListLimit = 1000;

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("memory");
  return logger;
}

void ValidateContent(const std::string& content) {
  if (Trim(content).empty()) {
    throw ValidationError("memory content must not be empty");
  }
}

std::string RequireNonBlank(const std::string& value, const char* field) {
  auto trimmed = Trim(value);
  if (trimmed.empty()) {
    throw ValidationError(std::string(field) + " must not be empty");
  }
  return trimmed;
}

std::optional<std::string> OptionalNonBlank(const std::optional<std::string>& value, const char* field) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return RequireNonBlank(*value, field);
}

// Turns the unique-slug violation into a message that names the slug.
template <typename Fn>
auto WithSlugConstraint(const std::optional<std::string>& slug, Fn&& fn) {
  try {
    return fn();
  } catch (const ConstraintError& ex) {
    if (slug.has_value() && std::string_view(ex.what()).find("memories.slug") != std::string_view::npos) {
      throw ConstraintError("slug already in use: " + *slug);
    }
    throw;
  }
}

// Writes one row; created_at doubles as updated_at.
void InsertMemory(Connection& conn, const Memory& memory, const std::string& model) {
  auto insert = conn.Prepare(
      "INSERT INTO memories(id, content, source, importance, tags, session_id, domain, created_at, updated_at, "
      "agent_type, agent_context, access_scope, slug, parent_memory_id, chunk_level, chunk_index) "
      "VALUES(?1, ?2, ?3, ?4, json(?5), ?6, ?7, ?8, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15);");
  insert.BindText(1, memory.id);
  insert.BindText(2, memory.content);
  insert.BindText(3, memory.source);
  insert.BindInt64(4, memory.importance);
  insert.BindText(5, JsonStringArray(memory.tags));
  insert.BindText(6, memory.session_id);
  insert.BindText(7, memory.domain);
  insert.BindText(8, FormatTimestamp(memory.created_at));
  insert.BindText(9, std::string(ToString(memory.agent_type)));
  insert.BindText(10, memory.agent_context);
  insert.BindText(11, memory.access_scope);
  insert.BindText(12, memory.slug);
  insert.BindText(13, memory.parent_memory_id);
  insert.BindInt64(14, memory.chunk_level);
  insert.BindInt64(15, memory.chunk_index);
  insert.Step();

  if (memory.embedding.has_value()) {
    StoreVector(conn, memory.id, *memory.embedding, model, memory.created_at);
  }
}

// Chunks inherit everything from the parent except content, slug and
// embedding.
void InsertChunks(Connection& conn, const Memory& parent, std::vector<Memory>& chunks, const std::string& model) {
  for (auto& chunk : chunks) {
    chunk.id = NewId();
    chunk.importance = parent.importance;
    chunk.tags = parent.tags;
    chunk.domain = parent.domain;
    chunk.source = parent.source;
    chunk.session_id = parent.session_id;
    chunk.created_at = parent.updated_at;
    chunk.updated_at = parent.updated_at;
    chunk.agent_type = parent.agent_type;
    chunk.agent_context = parent.agent_context;
    chunk.access_scope = parent.access_scope;
    chunk.parent_memory_id = parent.id;
    InsertMemory(conn, chunk, model);
  }
}

}  // namespace

Memory ReadMemoryRow(const Statement& stmt, int first_column) {
  const int c = first_column;
  Memory memory{};
  memory.id = stmt.ColumnText(c + 0);
  memory.content = stmt.ColumnText(c + 1);
  memory.importance = static_cast<int>(stmt.ColumnInt64(c + 2));
  memory.tags = ParseJsonStringArray(stmt.ColumnOptionalText(c + 3));
  memory.domain = stmt.ColumnOptionalText(c + 4);
  memory.source = stmt.ColumnOptionalText(c + 5);
  memory.session_id = stmt.ColumnText(c + 6);
  if (!stmt.ColumnIsNull(c + 7)) {
    memory.embedding = DecodeEmbedding(stmt.ColumnBlob(c + 7));
  }
  memory.created_at = ParseTimestamp(stmt.ColumnText(c + 8));
  memory.updated_at = ParseTimestamp(stmt.ColumnText(c + 9));
  memory.agent_type = ParseAgentType(stmt.ColumnText(c + 10));
  memory.agent_context = stmt.ColumnOptionalText(c + 11);
  memory.access_scope = stmt.ColumnText(c + 12);
  memory.slug = stmt.ColumnOptionalText(c + 13);
  memory.parent_memory_id = stmt.ColumnOptionalText(c + 14);
  memory.chunk_level = static_cast<int>(stmt.ColumnInt64(c + 15));
  memory.chunk_index = static_cast<int>(stmt.ColumnInt64(c + 16));
  return memory;
}

std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags) {
  std::vector<std::string> out{};
  std::unordered_set<std::string> seen{};
  for (const auto& raw : tags) {
    for (const unsigned char ch : raw) {
      if (std::iscntrl(ch) != 0) {
        throw ValidationError("tag contains a control character");
      }
    }
    auto tag = Trim(raw);
    std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char ch) {
      return static_cast<char>(std::tolower(ch));
    });
    if (tag.empty() || !seen.insert(tag).second) {
      continue;
    }
    out.push_back(std::move(tag));
  }
  return out;
}

void ValidateImportance(int importance) {
  if (importance < kMinImportance || importance > kMaxImportance) {
    throw ValidationError("importance must be between " + std::to_string(kMinImportance) + " and " +
                          std::to_string(kMaxImportance) + ", got " + std::to_string(importance));
  }
}

std::optional<Memory> LoadMemory(Connection& conn, const std::string& id) {
  auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns + " FROM memories m WHERE m.id = ?1;");
  stmt.BindText(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadMemoryRow(stmt);
}

std::vector<Memory> LoadMemories(Connection& conn, const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return {};
  }
  auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns +
                           " FROM memories m WHERE m.id IN (SELECT value FROM json_each(?1));");
  stmt.BindText(1, JsonStringArray(ids));
  std::unordered_map<std::string, Memory> by_id{};
  while (stmt.Step()) {
    auto memory = ReadMemoryRow(stmt);
    auto key = memory.id;
    by_id.emplace(std::move(key), std::move(memory));
  }
  std::vector<Memory> out{};
  out.reserve(by_id.size());
  for (const auto& id : ids) {
    const auto it = by_id.find(id);
    if (it != by_id.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

bool MemoryExists(Connection& conn, const std::string& id) {
  auto stmt = conn.Prepare("SELECT 1 FROM memories WHERE id = ?1;");
  stmt.BindText(1, id);
  return stmt.Step();
}

MemoryStore::MemoryStore(Database& db, const EmbeddingGateway& embeddings, ChunkingConfig chunking)
    : db_(db), embeddings_(embeddings), chunking_(chunking) {}

std::optional<std::vector<float>> MemoryStore::TryEmbed(const std::string& text) const {
  if (!embeddings_.available()) {
    return std::nullopt;
  }
  try {
    return embeddings_.Embed(text);
  } catch (const DependencyUnavailableError& ex) {
    Log()->warn("embedding failed, storing memory without vector: {}", ex.what());
    return std::nullopt;
  }
}

std::vector<Memory> MemoryStore::PrepareChunks(const std::string& content, bool embed) const {
  const auto pieces = ChunkContent(content, chunking_);
  std::vector<Memory> chunks{};
  chunks.reserve(pieces.size());
  std::vector<std::string> texts{};
  texts.reserve(pieces.size());
  for (const auto& piece : pieces) {
    Memory chunk{};
    chunk.content = piece.content;
    chunk.chunk_level = piece.level;
    chunk.chunk_index = piece.index;
    chunks.push_back(std::move(chunk));
    texts.push_back(piece.content);
  }
  if (!embed || chunks.empty()) {
    return chunks;
  }
  try {
    auto vectors = embeddings_.EmbedBatch(texts);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      chunks[i].embedding = std::move(vectors[i]);
    }
  } catch (const DependencyUnavailableError& ex) {
    Log()->warn("chunk embedding failed, storing {} chunk(s) without vectors: {}", chunks.size(), ex.what());
  }
  return chunks;
}

Memory MemoryStore::Create(const CreateMemoryRequest& request) {
  ValidateContent(request.content);
  const int importance = request.importance.value_or(kDefaultImportance);
  ValidateImportance(importance);
  const auto session_id = RequireNonBlank(request.session_id, "session id");
  const auto domain = OptionalNonBlank(request.domain, "domain");
  const auto slug = OptionalNonBlank(request.slug, "slug");
  const auto access_scope =
      request.access_scope.has_value() ? RequireNonBlank(*request.access_scope, "access scope") : kDefaultAccessScope;

  Memory memory{};
  memory.id = NewId();
  memory.content = request.content;
  memory.importance = importance;
  memory.tags = NormalizeTags(request.tags);
  memory.source = request.source;
  memory.session_id = session_id;
  memory.agent_type = request.agent_type;
  memory.agent_context = request.agent_context;
  memory.access_scope = access_scope;
  memory.slug = slug;

  // Embed before the transaction opens; a slow provider must not hold the
  // write lock.
  memory.embedding = TryEmbed(memory.content);
  auto chunks = PrepareChunks(memory.content, memory.embedding.has_value());
  const auto model = embeddings_.available() ? embeddings_.model() : std::string{};

  auto created = WithSlugConstraint(slug, [&]() {
    return db_.Write([&](Connection& conn) {
      const auto now = db_.clock().Now();
      memory.created_at = now;
      memory.updated_at = now;
      if (domain.has_value()) {
        memory.domain = EnsureDomain(conn, *domain, now);
      }
      TouchSession(conn, memory.session_id, memory.agent_type, memory.agent_context, now);
      InsertMemory(conn, memory, model);
      InsertChunks(conn, memory, chunks, model);
      return memory;
    });
  });
  if (!chunks.empty()) {
    Log()->debug("stored memory {} with {} chunk(s)", created.id, chunks.size());
  }
  return created;
}

Memory MemoryStore::Get(const std::string& id) {
  auto memory = db_.Read([&](Connection& conn) { return LoadMemory(conn, id); });
  if (!memory.has_value()) {
    throw NotFoundError("memory", id);
  }
  return std::move(*memory);
}

Memory MemoryStore::GetBySlug(const std::string& slug) {
  auto memory = db_.Read([&](Connection& conn) -> std::optional<Memory> {
    auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns + " FROM memories m WHERE m.slug = ?1;");
    stmt.BindText(1, slug);
    if (!stmt.Step()) {
      return std::nullopt;
    }
    return ReadMemoryRow(stmt);
  });
  if (!memory.has_value()) {
    throw NotFoundError("memory with slug", slug);
  }
  return std::move(*memory);
}

Memory MemoryStore::Update(const std::string& id, const MemoryUpdate& update) {
  if (update.empty()) {
    throw ValidationError("memory update has no fields set");
  }
  if (update.content.has_value()) {
    ValidateContent(*update.content);
  }
  if (update.importance.has_value()) {
    ValidateImportance(*update.importance);
  }
  const auto domain = OptionalNonBlank(update.domain, "domain");
  const auto tags = update.tags.has_value() ? std::optional<std::vector<std::string>>(NormalizeTags(*update.tags))
                                            : std::nullopt;

  std::optional<std::vector<float>> embedding{};
  std::vector<Memory> chunks{};
  if (update.content.has_value()) {
    embedding = TryEmbed(*update.content);
    chunks = PrepareChunks(*update.content, embedding.has_value());
  }
  const auto model = embeddings_.available() ? embeddings_.model() : std::string{};

  return db_.Write([&](Connection& conn) {
    auto current = LoadMemory(conn, id);
    if (!current.has_value()) {
      throw NotFoundError("memory", id);
    }
    const auto now = db_.clock().Now();
    Memory next = std::move(*current);
    if (update.content.has_value()) {
      next.content = *update.content;
    }
    if (update.importance.has_value()) {
      next.importance = *update.importance;
    }
    if (tags.has_value()) {
      next.tags = *tags;
    }
    if (update.source.has_value()) {
      next.source = update.source;
    }
    if (domain.has_value()) {
      next.domain = EnsureDomain(conn, *domain, now);
    }

    auto stmt = conn.Prepare(
        "UPDATE memories SET content = ?2, importance = ?3, tags = json(?4), source = ?5, domain = ?6, "
        "updated_at = ?7 WHERE id = ?1;");
    stmt.BindText(1, id);
    stmt.BindText(2, next.content);
    stmt.BindInt64(3, next.importance);
    stmt.BindText(4, JsonStringArray(next.tags));
    stmt.BindText(5, next.source);
    stmt.BindText(6, next.domain);
    stmt.BindText(7, FormatTimestamp(now));
    stmt.Step();

    if (update.content.has_value()) {
      if (embedding.has_value()) {
        StoreVector(conn, id, *embedding, model, now);
      } else {
        RemoveVector(conn, id);
      }
    }
    // Chunks are never re-chunked; a parent's chunks follow its content and
    // shared fields.
    if (next.chunk_level == 0) {
      if (update.content.has_value()) {
        auto drop = conn.Prepare("DELETE FROM memories WHERE parent_memory_id = ?1;");
        drop.BindText(1, id);
        drop.Step();
        next.updated_at = now;
        InsertChunks(conn, next, chunks, model);
      } else {
        auto sync = conn.Prepare(
            "UPDATE memories SET importance = ?2, tags = json(?3), source = ?4, domain = ?5, updated_at = ?6 "
            "WHERE parent_memory_id = ?1;");
        sync.BindText(1, id);
        sync.BindInt64(2, next.importance);
        sync.BindText(3, JsonStringArray(next.tags));
        sync.BindText(4, next.source);
        sync.BindText(5, next.domain);
        sync.BindText(6, FormatTimestamp(now));
        sync.Step();
      }
    }
    TouchSession(conn, next.session_id, next.agent_type, next.agent_context, now);

    auto stored = LoadMemory(conn, id);
    if (!stored.has_value()) {
      throw InternalError("memory vanished during update: " + id);
    }
    return std::move(*stored);
  });
}

void MemoryStore::Delete(const std::string& id) {
  db_.Write([&](Connection& conn) {
    auto lookup = conn.Prepare("SELECT session_id, agent_type, agent_context FROM memories WHERE id = ?1;");
    lookup.BindText(1, id);
    if (!lookup.Step()) {
      throw NotFoundError("memory", id);
    }
    const auto session_id = lookup.ColumnText(0);
    const auto agent_type = ParseAgentType(lookup.ColumnText(1));
    const auto agent_context = lookup.ColumnOptionalText(2);

    // Relationships, categorizations and vector metadata go with the row
    // through ON DELETE CASCADE.
    auto remove = conn.Prepare("DELETE FROM memories WHERE id = ?1;");
    remove.BindText(1, id);
    remove.Step();
    TouchSession(conn, session_id, agent_type, agent_context, db_.clock().Now());
  });
  Log()->debug("deleted memory {}", id);
}

std::vector<Memory> MemoryStore::List(const ListMemoriesFilter& filter) {
  if (filter.limit <= 0 || filter.limit > kMaxListLimit) {
    throw ValidationError("limit must be between 1 and " + std::to_string(kMaxListLimit));
  }
  if (filter.offset < 0) {
    throw ValidationError("offset must not be negative");
  }
  if (filter.min_importance.has_value()) {
    ValidateImportance(*filter.min_importance);
  }
  if (filter.max_importance.has_value()) {
    ValidateImportance(*filter.max_importance);
  }
  if (filter.min_importance.has_value() && filter.max_importance.has_value() &&
      *filter.min_importance > *filter.max_importance) {
    throw ValidationError("min importance exceeds max importance");
  }

  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns +
                             " FROM memories m "
                             "WHERE (?1 IS NULL OR m.domain = ?1 COLLATE NOCASE) "
                             "AND (?2 IS NULL OR m.session_id = ?2) "
                             "AND (?3 IS NULL OR m.importance >= ?3) "
                             "AND (?4 IS NULL OR m.importance <= ?4) "
                             "AND (?7 OR m.parent_memory_id IS NULL) "
                             "ORDER BY m.created_at DESC, m.id ASC LIMIT ?5 OFFSET ?6;");
    stmt.BindText(1, filter.domain);
    stmt.BindText(2, filter.session_id);
    if (filter.min_importance.has_value()) {
      stmt.BindInt64(3, *filter.min_importance);
    } else {
      stmt.BindNull(3);
    }
    if (filter.max_importance.has_value()) {
      stmt.BindInt64(4, *filter.max_importance);
    } else {
      stmt.BindNull(4);
    }
    stmt.BindInt64(5, filter.limit);
    stmt.BindInt64(6, filter.offset);
    stmt.BindInt64(7, filter.include_chunks ? 1 : 0);
    std::vector<Memory> out{};
    while (stmt.Step()) {
      out.push_back(ReadMemoryRow(stmt));
    }
    return out;
  });
}

std::vector<Memory> MemoryStore::GetChunks(const std::string& parent_id) {
  return db_.Read([&](Connection& conn) {
    if (!MemoryExists(conn, parent_id)) {
      throw NotFoundError("memory", parent_id);
    }
    auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns +
                             " FROM memories m WHERE m.parent_memory_id = ?1 ORDER BY m.chunk_index ASC;");
    stmt.BindText(1, parent_id);
    std::vector<Memory> out{};
    while (stmt.Step()) {
      out.push_back(ReadMemoryRow(stmt));
    }
    return out;
  });
}

int MemoryStore::BackfillEmbeddings(int limit) {
  if (limit <= 0) {
    throw ValidationError("backfill limit must be positive");
  }
  if (!embeddings_.available()) {
    throw DependencyUnavailableError("no embedding provider is configured");
  }

  struct Pending {
    std::string id;
    std::string content;
  };
  const auto pending = db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(
        "SELECT m.id, m.content FROM memories m "
        "WHERE NOT EXISTS (SELECT 1 FROM vector_metadata v WHERE v.memory_id = m.id) "
        "ORDER BY m.created_at ASC, m.id ASC LIMIT ?1;");
    stmt.BindInt64(1, limit);
    std::vector<Pending> out{};
    while (stmt.Step()) {
      out.push_back(Pending{.id = stmt.ColumnText(0), .content = stmt.ColumnText(1)});
    }
    return out;
  });
  if (pending.empty()) {
    return 0;
  }

  std::vector<std::string> texts{};
  texts.reserve(pending.size());
  for (const auto& item : pending) {
    texts.push_back(item.content);
  }
  const auto embeddings = embeddings_.EmbedBatch(texts);
  const auto model = embeddings_.model();

  const int indexed = db_.Write([&](Connection& conn) {
    const auto now = db_.clock().Now();
    int count = 0;
    auto check = conn.Prepare("SELECT content FROM memories WHERE id = ?1;");
    for (std::size_t i = 0; i < pending.size(); ++i) {
      check.Reset();
      check.BindText(1, pending[i].id);
      // Skip rows deleted or rewritten since they were read.
      if (!check.Step() || check.ColumnText(0) != pending[i].content) {
        continue;
      }
      StoreVector(conn, pending[i].id, embeddings[i], model, now);
      ++count;
    }
    return count;
  });
  Log()->info("backfilled {} embedding(s)", indexed);
  return indexed;
}

}  // namespace mycelic
