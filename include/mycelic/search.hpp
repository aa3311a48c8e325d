#pragma once

#include "mycelic/config.hpp"
#include "mycelic/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mycelic {

class Database;
class EmbeddingGateway;

enum class SearchSource {
  kKeyword,
  kTag,
  kDateRange,
  kSemantic,
};

const char* ToString(SearchSource source);

enum class TagOperator {
  kAnd,
  kOr,
};

struct KeywordQuery {
  std::string text;
};

struct TagQuery {
  std::vector<std::string> tags;
  TagOperator op = TagOperator::kOr;
};

// Inclusive on both ends; at least one bound is required.
struct DateRangeQuery {
  std::optional<Timestamp> start;
  std::optional<Timestamp> end;
};

struct SemanticQuery {
  std::string text;
  std::optional<double> min_similarity;
};

struct HybridQuery {
  std::string text;
  // Keyword channel weight; the semantic channel gets 1 - alpha.
  std::optional<float> alpha;
  std::optional<double> min_similarity;
};

using SearchQuery = std::variant<KeywordQuery, TagQuery, DateRangeQuery, SemanticQuery, HybridQuery>;

const char* ModeName(const SearchQuery& query);

// Applied to the ranked candidates of every mode. Search widens its
// candidate window until limit results pass or the mode runs out.
struct SearchFilters {
  std::optional<std::string> domain;
  std::optional<std::string> session_id;
  std::optional<std::string> access_scope;

  [[nodiscard]] bool empty() const {
    return !domain.has_value() && !session_id.has_value() && !access_scope.has_value();
  }
};

struct SearchRequest {
  SearchQuery query;
  SearchFilters filters{};
  std::optional<int> limit;
  double min_relevance = 0.0;
};

struct ScoredResult {
  Memory memory;
  // In [0, 1]; higher is better.
  double relevance = 0.0;
  std::vector<SearchSource> sources;
};

struct RankedCandidate {
  std::string memory_id;
  double score = 0.0;
  std::vector<SearchSource> sources;
};

// Weighted reciprocal-rank fusion of two best-first channels, scaled by
// (rrf_k + 1) so a candidate ranked first in both channels scores 1.0.
std::vector<RankedCandidate> FuseRankedChannels(const std::vector<RankedCandidate>& keyword,
                                                const std::vector<RankedCandidate>& semantic,
                                                float alpha,
                                                int rrf_k);

class SearchDispatcher {
 public:
  SearchDispatcher(Database& db, const EmbeddingGateway& embeddings, SearchConfig config);

  std::vector<ScoredResult> Search(const SearchRequest& request) const;

 private:
  struct CandidateBatch {
    std::vector<RankedCandidate> ranked;
    // No candidates exist beyond this batch.
    bool exhausted = false;
  };

  // Tag and date-range candidates come back already filtered; keyword and
  // semantic candidates are ranked over the whole store.
  CandidateBatch Candidates(const KeywordQuery& query, int count, const SearchFilters& filters) const;
  CandidateBatch Candidates(const TagQuery& query, int count, const SearchFilters& filters) const;
  CandidateBatch Candidates(const DateRangeQuery& query, int count, const SearchFilters& filters) const;
  CandidateBatch Candidates(const SemanticQuery& query, int count, const SearchFilters& filters) const;
  CandidateBatch Candidates(const HybridQuery& query, int count, const SearchFilters& filters) const;

  CandidateBatch SemanticChannel(const std::string& text, double min_similarity, int count) const;

  Database& db_;
  const EmbeddingGateway& embeddings_;
  SearchConfig config_;
};

}  // namespace mycelic
