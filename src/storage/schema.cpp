#include "mycelic/schema.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/sqlite_database.hpp"

#include <array>
#include <string>

namespace mycelic {
namespace {

struct Migration {
  int version;
  const char* name;
  const char* sql;
};

constexpr const char* kCoreTables = R"sql(
CREATE TABLE memories (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  content TEXT NOT NULL CHECK (length(trim(content)) > 0),
  source TEXT,
  importance INTEGER NOT NULL DEFAULT 5 CHECK (importance BETWEEN 1 AND 10),
  tags TEXT NOT NULL DEFAULT '[]',
  session_id TEXT NOT NULL,
  domain TEXT,
  embedding BLOB,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  agent_type TEXT NOT NULL DEFAULT 'unknown'
    CHECK (agent_type IN ('desktop-agent', 'code-agent', 'api-caller', 'unknown')),
  agent_context TEXT,
  access_scope TEXT NOT NULL DEFAULT 'session',
  slug TEXT
);
CREATE INDEX idx_memories_session_id ON memories(session_id);
CREATE INDEX idx_memories_domain ON memories(domain);
CREATE INDEX idx_memories_created_at ON memories(created_at);
CREATE INDEX idx_memories_importance ON memories(importance);
CREATE INDEX idx_memories_access_scope ON memories(access_scope);
CREATE UNIQUE INDEX idx_memories_slug_unique ON memories(slug) WHERE slug IS NOT NULL;

CREATE TABLE memory_relationships (
  id TEXT PRIMARY KEY,
  source_memory_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,
  target_memory_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,
  relationship_type TEXT NOT NULL CHECK (relationship_type IN
    ('references', 'contradicts', 'expands', 'similar', 'sequential', 'causes', 'enables')),
  strength REAL NOT NULL CHECK (strength >= 0.0 AND strength <= 1.0),
  context TEXT,
  auto_generated INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL
);
CREATE INDEX idx_relationships_source ON memory_relationships(source_memory_id);
CREATE INDEX idx_relationships_target ON memory_relationships(target_memory_id);
CREATE INDEX idx_relationships_type ON memory_relationships(relationship_type);

CREATE TABLE categories (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL UNIQUE,
  description TEXT NOT NULL,
  parent_category_id TEXT REFERENCES categories(id) ON DELETE SET NULL,
  confidence_threshold REAL NOT NULL DEFAULT 0.7
    CHECK (confidence_threshold >= 0.0 AND confidence_threshold <= 1.0),
  auto_generated INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL
);
CREATE INDEX idx_categories_parent ON categories(parent_category_id);

CREATE TABLE memory_categorizations (
  memory_id TEXT NOT NULL REFERENCES memories(id) ON DELETE CASCADE,
  category_id TEXT NOT NULL REFERENCES categories(id) ON DELETE CASCADE,
  confidence REAL NOT NULL CHECK (confidence >= 0.0 AND confidence <= 1.0),
  reasoning TEXT,
  created_at TEXT NOT NULL,
  PRIMARY KEY (memory_id, category_id)
);
CREATE INDEX idx_categorizations_category ON memory_categorizations(category_id);

CREATE TABLE domains (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL UNIQUE COLLATE NOCASE,
  description TEXT,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);

CREATE TABLE vector_metadata (
  memory_id TEXT PRIMARY KEY REFERENCES memories(id) ON DELETE CASCADE,
  vector_index INTEGER NOT NULL,
  embedding_model TEXT NOT NULL,
  embedding_dimension INTEGER NOT NULL,
  last_updated TEXT NOT NULL
);

CREATE TABLE agent_sessions (
  session_id TEXT PRIMARY KEY,
  agent_type TEXT NOT NULL
    CHECK (agent_type IN ('desktop-agent', 'code-agent', 'api-caller', 'unknown')),
  agent_context TEXT,
  created_at TEXT NOT NULL,
  last_accessed TEXT NOT NULL,
  is_active INTEGER NOT NULL DEFAULT 1
);
)sql";

// External-content index keyed by memories.seq; the triggers keep it in the
// same transaction as the row change.
constexpr const char* kMemoriesFts = R"sql(
CREATE VIRTUAL TABLE memories_fts USING fts5(
  content,
  source,
  tags,
  content='memories',
  content_rowid='seq',
  tokenize='unicode61 remove_diacritics 2'
);
CREATE TRIGGER memories_fts_ai AFTER INSERT ON memories BEGIN
  INSERT INTO memories_fts(rowid, content, source, tags) VALUES (new.seq, new.content, new.source, new.tags);
END;
CREATE TRIGGER memories_fts_ad AFTER DELETE ON memories BEGIN
  INSERT INTO memories_fts(memories_fts, rowid, content, source, tags)
  VALUES ('delete', old.seq, old.content, old.source, old.tags);
END;
CREATE TRIGGER memories_fts_au AFTER UPDATE OF content, source, tags ON memories BEGIN
  INSERT INTO memories_fts(memories_fts, rowid, content, source, tags)
  VALUES ('delete', old.seq, old.content, old.source, old.tags);
  INSERT INTO memories_fts(rowid, content, source, tags) VALUES (new.seq, new.content, new.source, new.tags);
END;
INSERT INTO memories_fts(memories_fts) VALUES ('rebuild');
)sql";

constexpr const char* kRelationshipPairIndexes = R"sql(
CREATE INDEX idx_relationships_source_target ON memory_relationships(source_memory_id, target_memory_id);
CREATE INDEX idx_relationships_target_source ON memory_relationships(target_memory_id, source_memory_id);
CREATE INDEX idx_relationships_source_strength ON memory_relationships(source_memory_id, strength);
CREATE INDEX idx_relationships_target_strength ON memory_relationships(target_memory_id, strength);
)sql";

// Long memories keep their full text on a root row (chunk_level 0) and get
// child rows for each chunk; children go with the root.
constexpr const char* kMemoryChunks = R"sql(
ALTER TABLE memories ADD COLUMN parent_memory_id TEXT REFERENCES memories(id) ON DELETE CASCADE;
ALTER TABLE memories ADD COLUMN chunk_level INTEGER NOT NULL DEFAULT 0 CHECK (chunk_level >= 0);
ALTER TABLE memories ADD COLUMN chunk_index INTEGER NOT NULL DEFAULT 0 CHECK (chunk_index >= 0);
CREATE INDEX idx_memories_parent ON memories(parent_memory_id, chunk_index);
)sql";

constexpr std::array<Migration, 4> kMigrations{{
    {1, "core_tables", kCoreTables},
    {2, "memories_fts", kMemoriesFts},
    {3, "relationship_pair_indexes", kRelationshipPairIndexes},
    {4, "memory_chunks", kMemoryChunks},
}};

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("schema");
  return logger;
}

void EnsureLedger(Connection& conn) {
  conn.Exec(
      "CREATE TABLE IF NOT EXISTS schema_migrations("
      "version INTEGER PRIMARY KEY,"
      "name TEXT NOT NULL,"
      "applied_at TEXT NOT NULL"
      ");");
}

}  // namespace

int LatestSchemaVersion() {
  return kMigrations.back().version;
}

void ApplyMigrations(Connection& conn, MonotonicClock& clock) {
  EnsureLedger(conn);
  for (const auto& migration : kMigrations) {
    // BEGIN IMMEDIATE serialises concurrent openers; the ledger is re-read
    // under the write lock.
    conn.Exec("BEGIN IMMEDIATE;");
    try {
      bool applied = false;
      {
        auto check = conn.Prepare("SELECT 1 FROM schema_migrations WHERE version = ?1;");
        check.BindInt64(1, migration.version);
        applied = check.Step();
      }
      if (applied) {
        conn.Exec("COMMIT;");
        continue;
      }
      conn.Exec(migration.sql);
      {
        auto record = conn.Prepare("INSERT INTO schema_migrations(version, name, applied_at) VALUES(?1, ?2, ?3);");
        record.BindInt64(1, migration.version);
        record.BindText(2, std::string(migration.name));
        record.BindText(3, FormatTimestamp(clock.Now()));
        record.Step();
      }
      conn.Exec("COMMIT;");
      Log()->info("applied migration {} ({})", migration.version, migration.name);
    } catch (const Error& ex) {
      try {
        conn.Exec("ROLLBACK;");
      } catch (const Error& rollback_error) {
        Log()->warn("migration rollback failed: {}", rollback_error.what());
      }
      throw InternalError(std::string("migration ") + migration.name + " failed: " + ex.what());
    }
  }
  const int version = SchemaVersion(conn);
  if (version > LatestSchemaVersion()) {
    throw InternalError("database schema version " + std::to_string(version) + " is newer than supported version " +
                        std::to_string(LatestSchemaVersion()));
  }
}

int SchemaVersion(Connection& conn) {
  auto stmt = conn.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  if (!stmt.Step()) {
    return 0;
  }
  return static_cast<int>(stmt.ColumnInt64(0));
}

std::vector<AppliedMigration> AppliedMigrations(Connection& conn) {
  auto stmt = conn.Prepare("SELECT version, name, applied_at FROM schema_migrations ORDER BY version;");
  std::vector<AppliedMigration> out{};
  while (stmt.Step()) {
    out.push_back(AppliedMigration{
        .version = static_cast<int>(stmt.ColumnInt64(0)),
        .name = stmt.ColumnText(1),
        .applied_at = ParseTimestamp(stmt.ColumnText(2)),
    });
  }
  return out;
}

}  // namespace mycelic
