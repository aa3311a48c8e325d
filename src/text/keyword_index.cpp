#include "mycelic/keyword_index.hpp"

#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/sqlite_database.hpp"
#include "mycelic/text.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "sqlite3.h"

namespace mycelic {
namespace {

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("search");
  return logger;
}

struct RawHit {
  std::string memory_id;
  double score = 0.0;
};

std::vector<RawHit> RunMatch(Connection& conn, const std::string& match, int limit) {
  auto stmt = conn.Prepare(
      "SELECT m.id, -bm25(memories_fts, 1.0, 0.5, 0.3) AS score "
      "FROM memories_fts JOIN memories m ON m.seq = memories_fts.rowid "
      "WHERE memories_fts MATCH ?1 "
      "ORDER BY score DESC, m.id ASC LIMIT ?2;");
  stmt.BindText(1, match);
  stmt.BindInt64(2, limit);
  std::vector<RawHit> hits{};
  while (stmt.Step()) {
    hits.push_back(RawHit{.memory_id = stmt.ColumnText(0), .score = stmt.ColumnDouble(1)});
  }
  return hits;
}

bool IsQuerySyntaxError(const InternalError& error) {
  return (error.sqlite_code() & 0xFF) == SQLITE_ERROR;
}

}  // namespace

std::string BuildFtsMatchQuery(const std::string& text) {
  std::unordered_set<std::string> seen{};
  std::string query{};
  for (const auto& token : TokenizeWords(text)) {
    if (!seen.insert(token).second) {
      continue;
    }
    if (!query.empty()) {
      query.append(" OR ");
    }
    query.push_back('"');
    query.append(token);
    query.push_back('"');
  }
  return query;
}

std::vector<KeywordHit> SearchKeywords(Connection& conn, const std::string& query, int limit) {
  if (limit <= 0) {
    return {};
  }

  std::vector<RawHit> raw{};
  try {
    raw = RunMatch(conn, query, limit);
  } catch (const InternalError& ex) {
    if (!IsQuerySyntaxError(ex)) {
      throw;
    }
    const auto fallback = BuildFtsMatchQuery(query);
    Log()->debug("fts5 rejected query '{}' ({}); retrying as '{}'", query, ex.what(), fallback);
    if (fallback.empty()) {
      return {};
    }
    raw = RunMatch(conn, fallback, limit);
  }

  double best = 0.0;
  for (const auto& hit : raw) {
    best = std::max(best, hit.score);
  }

  std::vector<KeywordHit> out{};
  out.reserve(raw.size());
  for (auto& hit : raw) {
    const double relevance = best > 0.0 ? std::clamp(hit.score / best, 1e-9, 1.0) : 1.0;
    out.push_back(KeywordHit{.memory_id = std::move(hit.memory_id), .relevance = relevance});
  }
  return out;
}

void CheckKeywordIndex(Connection& conn) {
  try {
    conn.Exec("INSERT INTO memories_fts(memories_fts, rank) VALUES('integrity-check', 1);");
  } catch (const InternalError& ex) {
    throw InternalError(std::string("keyword index out of sync: ") + ex.what(), ex.sqlite_code());
  }
}

void RebuildKeywordIndex(Connection& conn) {
  conn.Exec("INSERT INTO memories_fts(memories_fts) VALUES('rebuild');");
}

}  // namespace mycelic
