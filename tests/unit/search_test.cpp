#include "mycelic/embeddings.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/memory_engine.hpp"
#include "mycelic/search.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool ApproxEqual(double lhs, double rhs, double eps) {
  return std::fabs(lhs - rhs) <= eps;
}

std::filesystem::path UniquePath() {
  static int counter = 0;
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("mycelic_search_test_" + std::to_string(static_cast<long long>(now)) +
                                                   "_" + std::to_string(++counter) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

std::unique_ptr<mycelic::MemoryEngine> OpenEngine(const std::filesystem::path& path,
                                                  std::shared_ptr<mycelic::EmbeddingProvider> provider = nullptr) {
  mycelic::EngineConfig config{};
  config.database.path = path;
  return mycelic::MemoryEngine::Open(config, std::move(provider));
}

mycelic::Memory Create(mycelic::MemoryEngine& engine,
                       const std::string& content,
                       std::vector<std::string> tags = {},
                       std::optional<std::string> domain = std::nullopt,
                       const std::string& session = "search") {
  mycelic::CreateMemoryRequest request{};
  request.content = content;
  request.tags = std::move(tags);
  request.domain = std::move(domain);
  request.session_id = session;
  return engine.CreateMemory(request);
}

std::vector<std::string> Ids(const std::vector<mycelic::ScoredResult>& results) {
  std::vector<std::string> ids{};
  for (const auto& result : results) {
    ids.push_back(result.memory.id);
  }
  return ids;
}

bool HasSource(const mycelic::ScoredResult& result, mycelic::SearchSource source) {
  return std::find(result.sources.begin(), result.sources.end(), source) != result.sources.end();
}

mycelic::RankedCandidate Candidate(const std::string& id, mycelic::SearchSource source) {
  return mycelic::RankedCandidate{.memory_id = id, .score = 0.0, .sources = {source}};
}

void ScenarioReciprocalRankFusion() {
  mycelic::tests::Log("scenario: reciprocal rank fusion");
  const std::vector<mycelic::RankedCandidate> keyword{
      Candidate("a", mycelic::SearchSource::kKeyword),
      Candidate("b", mycelic::SearchSource::kKeyword),
  };
  const std::vector<mycelic::RankedCandidate> semantic{
      Candidate("b", mycelic::SearchSource::kSemantic),
      Candidate("c", mycelic::SearchSource::kSemantic),
  };
  const auto fused = mycelic::FuseRankedChannels(keyword, semantic, 0.5f, 60);
  Require(fused.size() == 3, "fusion must keep every candidate once");
  Require(fused[0].memory_id == "b", "candidate in both channels must rank first");
  Require(fused[1].memory_id == "a" && fused[2].memory_id == "c", "keyword rank 1 must beat semantic rank 2");
  Require(ApproxEqual(fused[0].score, 0.5 + 0.5 * 61.0 / 62.0, 1e-9), "fused score mismatch");
  Require(fused[0].sources.size() == 2, "fused candidate must carry both sources");

  const auto both_first = mycelic::FuseRankedChannels({Candidate("x", mycelic::SearchSource::kKeyword)},
                                                      {Candidate("x", mycelic::SearchSource::kSemantic)}, 0.3f, 60);
  Require(ApproxEqual(both_first[0].score, 1.0, 1e-9), "rank 1 in both channels must score 1.0");

  const auto keyword_only = mycelic::FuseRankedChannels(keyword, semantic, 1.0f, 60);
  Require(keyword_only[0].memory_id == "a", "alpha 1.0 must follow the keyword channel");
}

void ScenarioTagOperators(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: tag operators");
  auto engine = OpenEngine(path);
  const auto both = Create(*engine, "both tags", {"x", "y"}).id;
  const auto only_x = Create(*engine, "only x", {"x"}).id;
  const auto only_y = Create(*engine, "only y", {"Y"}).id;
  (void)Create(*engine, "neither", {"z"});

  const auto all = engine->Search(mycelic::SearchRequest{
      .query = mycelic::TagQuery{.tags = {"x", "y"}, .op = mycelic::TagOperator::kAnd},
  });
  Require(Ids(all) == std::vector<std::string>{both}, "AND must require every tag");
  Require(all[0].relevance == 1.0, "AND hits score 1.0");

  const auto any = engine->Search(mycelic::SearchRequest{
      .query = mycelic::TagQuery{.tags = {"X", "y"}, .op = mycelic::TagOperator::kOr},
  });
  Require(any.size() == 3, "OR must match either tag");
  Require(any[0].memory.id == both, "memory matching more tags must rank first");
  Require(ApproxEqual(any[1].relevance, 0.5, 1e-12), "partial OR hit scores matched/requested");
  const auto ids = Ids(any);
  Require(std::find(ids.begin(), ids.end(), only_x) != ids.end() && std::find(ids.begin(), ids.end(), only_y) != ids.end(),
          "OR results incomplete");

  bool threw = false;
  try {
    (void)engine->Search(mycelic::SearchRequest{.query = mycelic::TagQuery{.tags = {" "}}});
  } catch (const mycelic::ValidationError&) {
    threw = true;
  }
  Require(threw, "tag search without tags must be rejected");
}

void ScenarioDateRange(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: date range");
  auto engine = OpenEngine(path);
  const auto first = Create(*engine, "first");
  const auto second = Create(*engine, "second");
  const auto third = Create(*engine, "third");
  const auto fourth = Create(*engine, "fourth");

  const auto middle = engine->Search(mycelic::SearchRequest{
      .query = mycelic::DateRangeQuery{.start = second.created_at, .end = third.created_at},
  });
  Require(Ids(middle) == std::vector<std::string>({third.id, second.id}), "range must be inclusive and newest first");
  Require(middle[0].relevance == 1.0, "date range hits score 1.0");

  const auto open_start = engine->Search(mycelic::SearchRequest{
      .query = mycelic::DateRangeQuery{.end = first.created_at},
  });
  Require(Ids(open_start) == std::vector<std::string>{first.id}, "open start range mismatch");

  const auto open_end = engine->Search(mycelic::SearchRequest{
      .query = mycelic::DateRangeQuery{.start = fourth.created_at},
  });
  Require(Ids(open_end) == std::vector<std::string>{fourth.id}, "open end range mismatch");

  bool inverted = false;
  try {
    (void)engine->Search(mycelic::SearchRequest{
        .query = mycelic::DateRangeQuery{.start = third.created_at, .end = first.created_at},
    });
  } catch (const mycelic::ValidationError&) {
    inverted = true;
  }
  Require(inverted, "start after end must be rejected");

  bool unbounded = false;
  try {
    (void)engine->Search(mycelic::SearchRequest{.query = mycelic::DateRangeQuery{}});
  } catch (const mycelic::ValidationError&) {
    unbounded = true;
  }
  Require(unbounded, "range without bounds must be rejected");
}

void ScenarioFiltersApplyToEveryMode(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: filters apply to every mode");
  auto engine = OpenEngine(path);
  // Oldest and weakest keyword match, so it ranks last in every mode.
  const auto target = Create(*engine, "kernel lecture notes for the operating systems course", {"os"}, "Teaching", "class");
  // Twelve distractors outrank it: more than limit * filter_overfetch (2 * 5).
  for (int i = 0; i < 12; ++i) {
    (void)Create(*engine, "kernel kernel " + std::to_string(i), {"os"}, "systems", "other");
  }

  const auto listed = engine->ListMemories(mycelic::ListMemoriesFilter{.domain = "teaching"});
  Require(listed.size() == 1 && listed[0].id == target.id, "list domain filter mismatch");

  const mycelic::SearchFilters filters{.domain = "teaching"};
  const auto keyword = engine->Search(mycelic::SearchRequest{
      .query = mycelic::KeywordQuery{"kernel"},
      .filters = filters,
      .limit = 2,
  });
  Require(Ids(keyword) == std::vector<std::string>{target.id}, "keyword filter must reach past the first window");
  Require(keyword[0].relevance > 0.0 && keyword[0].relevance < 1.0, "filtered keyword hit keeps its store-wide relevance");

  const auto hybrid = engine->Search(mycelic::SearchRequest{
      .query = mycelic::HybridQuery{.text = "kernel"},
      .filters = filters,
      .limit = 2,
  });
  Require(Ids(hybrid) == std::vector<std::string>{target.id}, "degraded hybrid filter mismatch");

  const auto tags = engine->Search(mycelic::SearchRequest{
      .query = mycelic::TagQuery{.tags = {"os"}},
      .filters = mycelic::SearchFilters{.session_id = "class"},
      .limit = 2,
  });
  Require(Ids(tags) == std::vector<std::string>{target.id}, "tag session filter mismatch");

  const auto dated = engine->Search(mycelic::SearchRequest{
      .query = mycelic::DateRangeQuery{.start = target.created_at},
      .filters = filters,
      .limit = 2,
  });
  Require(Ids(dated) == std::vector<std::string>{target.id}, "date range domain filter mismatch");

  const auto systems = engine->Search(mycelic::SearchRequest{
      .query = mycelic::KeywordQuery{"kernel"},
      .filters = mycelic::SearchFilters{.domain = "SYSTEMS"},
      .limit = 12,
  });
  Require(systems.size() == 12, "every matching distractor should be returned");

  const auto scoped = engine->Search(mycelic::SearchRequest{
      .query = mycelic::TagQuery{.tags = {"os"}},
      .filters = mycelic::SearchFilters{.access_scope = "global"},
  });
  Require(scoped.empty(), "access scope filter must exclude session-scoped memories");
}

void ScenarioLimitsAndThresholds(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: limits and thresholds");
  auto engine = OpenEngine(path);
  for (int i = 0; i < 5; ++i) {
    (void)Create(*engine, "shared term " + std::to_string(i), {"t"});
  }
  const auto limited = engine->Search(mycelic::SearchRequest{.query = mycelic::TagQuery{.tags = {"t"}}, .limit = 3});
  Require(limited.size() == 3, "limit must cap results");

  const auto thresholded = engine->Search(mycelic::SearchRequest{
      .query = mycelic::TagQuery{.tags = {"t", "absent"}},
      .min_relevance = 0.75,
  });
  Require(thresholded.empty(), "results below min_relevance must be dropped");

  for (const int bad : {0, -1, 5000}) {
    bool threw = false;
    try {
      (void)engine->Search(mycelic::SearchRequest{.query = mycelic::TagQuery{.tags = {"t"}}, .limit = bad});
    } catch (const mycelic::ValidationError&) {
      threw = true;
    }
    Require(threw, "limit " + std::to_string(bad) + " must be rejected");
  }
}

void ScenarioSemanticRequiresProvider(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: semantic requires provider");
  auto engine = OpenEngine(path);
  (void)Create(*engine, "go routines and channels");
  bool threw = false;
  try {
    (void)engine->Search(mycelic::SearchRequest{.query = mycelic::SemanticQuery{.text = "goroutines"}});
  } catch (const mycelic::DependencyUnavailableError&) {
    threw = true;
  }
  Require(threw, "semantic search without a provider must report the missing dependency");

  const auto hybrid = engine->Search(mycelic::SearchRequest{.query = mycelic::HybridQuery{.text = "channels"}});
  Require(hybrid.size() == 1, "hybrid search must degrade to keyword results");
  Require(hybrid[0].sources == std::vector<mycelic::SearchSource>{mycelic::SearchSource::kKeyword},
          "degraded hybrid results come from the keyword channel only");
}

void ScenarioSemanticAndHybridWithProvider(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: semantic and hybrid with provider");
  auto engine = OpenEngine(path, std::make_shared<mycelic::HashingEmbeddingProvider>(2048));
  const auto go = Create(*engine, "golang goroutines channels concurrency").id;
  const auto garden = Create(*engine, "tomato seedlings need sunlight").id;
  const auto mixed = Create(*engine, "channels for concurrency in rust").id;

  const auto semantic = engine->Search(mycelic::SearchRequest{
      .query = mycelic::SemanticQuery{.text = "goroutines concurrency golang", .min_similarity = 0.2},
  });
  Require(!semantic.empty() && semantic[0].memory.id == go, "closest memory must rank first");
  for (const auto& result : semantic) {
    Require(result.memory.id != garden, "dissimilar memory must fall below the similarity floor");
    Require(result.relevance >= 0.2 && result.relevance <= 1.0, "semantic relevance out of range");
    Require(HasSource(result, mycelic::SearchSource::kSemantic), "semantic source missing");
  }

  const auto hybrid = engine->Search(mycelic::SearchRequest{
      .query = mycelic::HybridQuery{.text = "concurrency channels", .min_similarity = 0.1},
  });
  Require(hybrid.size() >= 2, "hybrid search must return both concurrency memories");
  for (const auto& result : hybrid) {
    if (result.memory.id == go || result.memory.id == mixed) {
      Require(HasSource(result, mycelic::SearchSource::kKeyword) && HasSource(result, mycelic::SearchSource::kSemantic),
              "memory found by both channels must record both");
    }
    Require(result.relevance > 0.0 && result.relevance <= 1.0, "hybrid relevance out of range");
  }

  bool threw = false;
  try {
    (void)engine->Search(mycelic::SearchRequest{.query = mycelic::HybridQuery{.text = "x", .alpha = 1.5f}});
  } catch (const mycelic::ValidationError&) {
    threw = true;
  }
  Require(threw, "alpha outside [0, 1] must be rejected");
}

}  // namespace

int main() {
  try {
    mycelic::tests::Log("search_test: start");
    std::vector<std::filesystem::path> paths{};
    for (int i = 0; i < 6; ++i) {
      paths.push_back(UniquePath());
    }
    ScenarioReciprocalRankFusion();
    ScenarioTagOperators(paths[0]);
    ScenarioDateRange(paths[1]);
    ScenarioFiltersApplyToEveryMode(paths[2]);
    ScenarioLimitsAndThresholds(paths[3]);
    ScenarioSemanticRequiresProvider(paths[4]);
    ScenarioSemanticAndHybridWithProvider(paths[5]);
    for (const auto& path : paths) {
      RemoveDatabase(path);
    }
    mycelic::tests::Log("search_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    mycelic::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
