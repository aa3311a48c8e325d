#pragma once

#include <string>
#include <vector>

namespace mycelic {

class Connection;

struct KeywordHit {
  std::string memory_id;
  // -bm25 scaled so the best candidate is 1.0; always in (0, 1].
  double relevance = 0.0;
};

// Full-text search over memories_fts. The query goes to MATCH as written, so
// phrases, boolean operators and prefixes are FTS5's. A query FTS5 cannot
// parse is retried as an OR of its quoted word tokens.
std::vector<KeywordHit> SearchKeywords(Connection& conn, const std::string& query, int limit);

// "a b a" -> "\"a\" OR \"b\""
std::string BuildFtsMatchQuery(const std::string& text);

// FTS5 'integrity-check': throws when the index and memories disagree.
void CheckKeywordIndex(Connection& conn);
void RebuildKeywordIndex(Connection& conn);

}  // namespace mycelic
