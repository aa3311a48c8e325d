#include "mycelic/search.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/embeddings.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/keyword_index.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/memory_store.hpp"
#include "mycelic/sqlite_database.hpp"
#include "mycelic/vector_index.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <future>
#include <limits>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mycelic {
namespace {

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("search");
  return logger;
}

bool ScoreLess(const RankedCandidate& lhs, const RankedCandidate& rhs) {
  const double lhs_score = std::isnan(lhs.score) ? 0.0 : lhs.score;
  const double rhs_score = std::isnan(rhs.score) ? 0.0 : rhs.score;
  if (lhs_score != rhs_score) {
    return lhs_score > rhs_score;
  }
  return lhs.memory_id < rhs.memory_id;
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

void RequireText(const std::string& text, const char* mode) {
  if (IsBlank(text)) {
    throw ValidationError(std::string(mode) + " search requires a non-empty query");
  }
}

double ResolveMinSimilarity(const std::optional<double>& requested, const SearchConfig& config) {
  const double value = requested.value_or(config.min_similarity);
  if (!(value >= 0.0 && value <= 1.0)) {
    throw ValidationError("min_similarity must be within [0, 1]");
  }
  return value;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
           return std::tolower(a) == std::tolower(b);
         });
}

bool PassesFilters(const Memory& memory, const SearchFilters& filters) {
  if (filters.domain.has_value() && (!memory.domain.has_value() || !EqualsIgnoreCase(*memory.domain, *filters.domain))) {
    return false;
  }
  if (filters.session_id.has_value() && memory.session_id != *filters.session_id) {
    return false;
  }
  if (filters.access_scope.has_value() && memory.access_scope != *filters.access_scope) {
    return false;
  }
  return true;
}

// Bound at ?10..?12 by BindFilters. Used only where filtering inside the
// query selects exactly what the final pass would.
constexpr const char* kFilterPredicate =
    "(?10 IS NULL OR m.domain = ?10 COLLATE NOCASE) AND (?11 IS NULL OR m.session_id = ?11) "
    "AND (?12 IS NULL OR m.access_scope = ?12)";

void BindFilters(Statement& stmt, const SearchFilters& filters) {
  stmt.BindText(10, filters.domain);
  stmt.BindText(11, filters.session_id);
  stmt.BindText(12, filters.access_scope);
}

int WidenWindow(int count) {
  return count > std::numeric_limits<int>::max() / 2 ? std::numeric_limits<int>::max() : count * 2;
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

const char* ToString(SearchSource source) {
  switch (source) {
    case SearchSource::kKeyword:
      return "keyword";
    case SearchSource::kTag:
      return "tag";
    case SearchSource::kDateRange:
      return "date_range";
    case SearchSource::kSemantic:
      return "semantic";
  }
  return "keyword";
}

const char* ModeName(const SearchQuery& query) {
  return std::visit(Overloaded{
                        [](const KeywordQuery&) { return "keyword"; },
                        [](const TagQuery&) { return "tag"; },
                        [](const DateRangeQuery&) { return "date_range"; },
                        [](const SemanticQuery&) { return "semantic"; },
                        [](const HybridQuery&) { return "hybrid"; },
                    },
                    query);
}

std::vector<RankedCandidate> FuseRankedChannels(const std::vector<RankedCandidate>& keyword,
                                                const std::vector<RankedCandidate>& semantic,
                                                float alpha,
                                                int rrf_k) {
  struct Aggregate {
    double score = 0.0;
    std::unordered_set<SearchSource> sources;
  };
  std::unordered_map<std::string, Aggregate> aggregates{};
  const double keyword_weight = std::clamp(static_cast<double>(alpha), 0.0, 1.0);
  const double semantic_weight = 1.0 - keyword_weight;
  const double base = static_cast<double>(rrf_k <= 0 ? 60 : rrf_k);

  auto apply_channel = [&](const std::vector<RankedCandidate>& channel, double weight) {
    for (std::size_t i = 0; i < channel.size(); ++i) {
      const auto rank = static_cast<double>(i + 1U);
      auto& agg = aggregates[channel[i].memory_id];
      agg.score += weight * (base + 1.0) / (base + rank);
      for (const auto source : channel[i].sources) {
        agg.sources.insert(source);
      }
    }
  };
  apply_channel(keyword, keyword_weight);
  apply_channel(semantic, semantic_weight);

  std::vector<RankedCandidate> out{};
  out.reserve(aggregates.size());
  for (auto& [memory_id, agg] : aggregates) {
    RankedCandidate item{};
    item.memory_id = memory_id;
    item.score = std::min(agg.score, 1.0);
    item.sources.assign(agg.sources.begin(), agg.sources.end());
    std::sort(item.sources.begin(), item.sources.end(), [](const auto lhs, const auto rhs) {
      return static_cast<int>(lhs) < static_cast<int>(rhs);
    });
    out.push_back(std::move(item));
  }
  std::sort(out.begin(), out.end(), ScoreLess);
  return out;
}

SearchDispatcher::SearchDispatcher(Database& db, const EmbeddingGateway& embeddings, SearchConfig config)
    : db_(db), embeddings_(embeddings), config_(config) {}

std::vector<ScoredResult> SearchDispatcher::Search(const SearchRequest& request) const {
  const int limit = request.limit.value_or(config_.default_limit);
  if (limit <= 0 || limit > config_.max_limit) {
    throw ValidationError("search limit must be between 1 and " + std::to_string(config_.max_limit));
  }
  if (!(request.min_relevance >= 0.0 && request.min_relevance <= 1.0)) {
    throw ValidationError("min_relevance must be within [0, 1]");
  }

  int count = limit;
  if (!request.filters.empty()) {
    count = static_cast<int>(std::min<long long>(static_cast<long long>(limit) * config_.filter_overfetch,
                                                 std::numeric_limits<int>::max()));
  }
  std::vector<ScoredResult> results{};
  for (int round = 1;; ++round) {
    const auto batch =
        std::visit([&](const auto& query) { return Candidates(query, count, request.filters); }, request.query);

    std::vector<std::string> ids{};
    ids.reserve(batch.ranked.size());
    for (const auto& candidate : batch.ranked) {
      ids.push_back(candidate.memory_id);
    }
    const auto memories = db_.Read([&](Connection& conn) { return LoadMemories(conn, ids); });
    std::unordered_map<std::string, const Memory*> by_id{};
    for (const auto& memory : memories) {
      by_id.emplace(memory.id, &memory);
    }

    results.clear();
    for (const auto& candidate : batch.ranked) {
      if (results.size() >= static_cast<std::size_t>(limit)) {
        break;
      }
      const auto it = by_id.find(candidate.memory_id);
      if (it == by_id.end() || candidate.score < request.min_relevance || !PassesFilters(*it->second, request.filters)) {
        continue;
      }
      results.push_back(ScoredResult{.memory = *it->second, .relevance = candidate.score, .sources = candidate.sources});
    }

    // Candidates are best first, so once one falls below min_relevance a
    // wider window cannot add results.
    const bool below_threshold = !batch.ranked.empty() && batch.ranked.back().score < request.min_relevance;
    if (results.size() >= static_cast<std::size_t>(limit) || batch.exhausted || below_threshold ||
        count == std::numeric_limits<int>::max()) {
      Log()->debug("{} search returned {} of {} candidate(s) after {} round(s)",
                   ModeName(request.query),
                   results.size(),
                   batch.ranked.size(),
                   round);
      return results;
    }
    count = WidenWindow(count);
  }
}

SearchDispatcher::CandidateBatch SearchDispatcher::Candidates(const KeywordQuery& query,
                                                              int count,
                                                              const SearchFilters& /*filters*/) const {
  RequireText(query.text, "keyword");
  const auto hits = db_.Read([&](Connection& conn) { return SearchKeywords(conn, query.text, count); });
  CandidateBatch batch{.exhausted = hits.size() < static_cast<std::size_t>(count)};
  batch.ranked.reserve(hits.size());
  for (const auto& hit : hits) {
    batch.ranked.push_back(
        RankedCandidate{.memory_id = hit.memory_id, .score = hit.relevance, .sources = {SearchSource::kKeyword}});
  }
  return batch;
}

SearchDispatcher::CandidateBatch SearchDispatcher::Candidates(const TagQuery& query,
                                                              int count,
                                                              const SearchFilters& filters) const {
  const auto tags = NormalizeTags(query.tags);
  if (tags.empty()) {
    throw ValidationError("tag search requires at least one tag");
  }
  const bool require_all = query.op == TagOperator::kAnd;
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string(
                                 "SELECT m.id, COUNT(DISTINCT j.value) AS matched FROM memories m, json_each(m.tags) j "
                                 "WHERE j.value IN (SELECT value FROM json_each(?1)) AND ") +
                             kFilterPredicate +
                             " GROUP BY m.id HAVING (?2 = 0 OR matched = ?3) "
                             "ORDER BY matched DESC, m.created_at DESC, m.id ASC LIMIT ?4;");
    stmt.BindText(1, JsonStringArray(tags));
    stmt.BindInt64(2, require_all ? 1 : 0);
    stmt.BindInt64(3, static_cast<std::int64_t>(tags.size()));
    stmt.BindInt64(4, count);
    BindFilters(stmt, filters);
    CandidateBatch batch{};
    while (stmt.Step()) {
      const auto matched = static_cast<double>(stmt.ColumnInt64(1));
      batch.ranked.push_back(RankedCandidate{.memory_id = stmt.ColumnText(0),
                                             .score = matched / static_cast<double>(tags.size()),
                                             .sources = {SearchSource::kTag}});
    }
    batch.exhausted = batch.ranked.size() < static_cast<std::size_t>(count);
    return batch;
  });
}

SearchDispatcher::CandidateBatch SearchDispatcher::Candidates(const DateRangeQuery& query,
                                                              int count,
                                                              const SearchFilters& filters) const {
  if (!query.start.has_value() && !query.end.has_value()) {
    throw ValidationError("date range search requires a start or an end");
  }
  if (query.start.has_value() && query.end.has_value() && *query.start > *query.end) {
    throw ValidationError("date range start is after its end");
  }
  // Stored timestamps have microsecond resolution.
  std::optional<std::string> start{};
  std::optional<std::string> end{};
  if (query.start.has_value()) {
    start = FormatTimestamp(std::chrono::ceil<std::chrono::microseconds>(*query.start));
  }
  if (query.end.has_value()) {
    end = FormatTimestamp(*query.end);
  }
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string(
                                 "SELECT m.id FROM memories m "
                                 "WHERE (?1 IS NULL OR m.created_at >= ?1) AND (?2 IS NULL OR m.created_at <= ?2) AND ") +
                             kFilterPredicate + " ORDER BY m.created_at DESC, m.id ASC LIMIT ?3;");
    stmt.BindText(1, start);
    stmt.BindText(2, end);
    stmt.BindInt64(3, count);
    BindFilters(stmt, filters);
    CandidateBatch batch{};
    while (stmt.Step()) {
      batch.ranked.push_back(
          RankedCandidate{.memory_id = stmt.ColumnText(0), .score = 1.0, .sources = {SearchSource::kDateRange}});
    }
    batch.exhausted = batch.ranked.size() < static_cast<std::size_t>(count);
    return batch;
  });
}

SearchDispatcher::CandidateBatch SearchDispatcher::SemanticChannel(const std::string& text,
                                                                   double min_similarity,
                                                                   int count) const {
  // Embedding happens outside any transaction.
  const auto embedding = embeddings_.Embed(text);
  const auto hits = db_.Read([&](Connection& conn) { return SearchVectors(conn, embedding, min_similarity, count); });
  CandidateBatch batch{.exhausted = hits.size() < static_cast<std::size_t>(count)};
  batch.ranked.reserve(hits.size());
  for (const auto& hit : hits) {
    batch.ranked.push_back(RankedCandidate{.memory_id = hit.memory_id,
                                           .score = std::clamp(static_cast<double>(hit.similarity), 0.0, 1.0),
                                           .sources = {SearchSource::kSemantic}});
  }
  return batch;
}

SearchDispatcher::CandidateBatch SearchDispatcher::Candidates(const SemanticQuery& query,
                                                              int count,
                                                              const SearchFilters& /*filters*/) const {
  RequireText(query.text, "semantic");
  const double min_similarity = ResolveMinSimilarity(query.min_similarity, config_);
  if (!embeddings_.available()) {
    throw DependencyUnavailableError("semantic search requires an embedding provider");
  }
  return SemanticChannel(query.text, min_similarity, count);
}

SearchDispatcher::CandidateBatch SearchDispatcher::Candidates(const HybridQuery& query,
                                                              int count,
                                                              const SearchFilters& filters) const {
  RequireText(query.text, "hybrid");
  const double min_similarity = ResolveMinSimilarity(query.min_similarity, config_);
  const float alpha = query.alpha.value_or(config_.hybrid_alpha);
  if (!(alpha >= 0.0f && alpha <= 1.0f)) {
    throw ValidationError("hybrid alpha must be within [0, 1]");
  }

  auto keyword_future =
      std::async(std::launch::async, [&]() { return Candidates(KeywordQuery{query.text}, count, filters); });

  CandidateBatch semantic{};
  bool semantic_ok = false;
  if (embeddings_.available()) {
    try {
      semantic = SemanticChannel(query.text, min_similarity, count);
      semantic_ok = true;
    } catch (const DependencyUnavailableError& ex) {
      Log()->warn("hybrid search falling back to keyword only: {}", ex.what());
    }
  } else {
    Log()->warn("hybrid search falling back to keyword only: no embedding provider");
  }

  auto keyword = keyword_future.get();
  if (!semantic_ok) {
    return keyword;
  }
  return CandidateBatch{
      .ranked = FuseRankedChannels(keyword.ranked, semantic.ranked, alpha, config_.rrf_k),
      .exhausted = keyword.exhausted && semantic.exhausted,
  };
}

}  // namespace mycelic
