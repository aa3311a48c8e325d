#include "mycelic/errors.hpp"
#include "mycelic/keyword_index.hpp"
#include "mycelic/memory_engine.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <chrono>
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

std::filesystem::path UniquePath() {
  static int counter = 0;
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("mycelic_keyword_test_" + std::to_string(static_cast<long long>(now)) +
                                                   "_" + std::to_string(++counter) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

std::unique_ptr<mycelic::MemoryEngine> OpenEngine(const std::filesystem::path& path) {
  mycelic::EngineConfig config{};
  config.database.path = path;
  return mycelic::MemoryEngine::Open(config);
}

std::string Create(mycelic::MemoryEngine& engine, const std::string& content, std::vector<std::string> tags = {}) {
  mycelic::CreateMemoryRequest request{};
  request.content = content;
  request.tags = std::move(tags);
  request.session_id = "keyword";
  return engine.CreateMemory(request).id;
}

std::vector<mycelic::ScoredResult> Keyword(mycelic::MemoryEngine& engine, const std::string& text) {
  return engine.Search(mycelic::SearchRequest{.query = mycelic::KeywordQuery{text}});
}

bool Contains(const std::vector<mycelic::ScoredResult>& results, const std::string& id) {
  return std::any_of(results.begin(), results.end(), [&](const auto& result) { return result.memory.id == id; });
}

void ScenarioBuildMatchQuery() {
  mycelic::tests::Log("scenario: build match query");
  Require(mycelic::BuildFtsMatchQuery("a b a") == "\"a\" OR \"b\"", "duplicate tokens must collapse");
  Require(mycelic::BuildFtsMatchQuery("Hello, WORLD!") == "\"hello\" OR \"world\"", "tokens must be lower-cased");
  Require(mycelic::BuildFtsMatchQuery("((  ))").empty(), "punctuation only yields an empty query");
  Require(mycelic::BuildFtsMatchQuery("Caf\xC3\xA9 CAFE na\xC3\xAFve") == "\"cafe\" OR \"naive\"",
          "accents must fold like the unicode61 tokenizer");
  Require(mycelic::BuildFtsMatchQuery("bad\xFF" "byte \xE6\x97\xA5\xE6\x9C\xAC") ==
              "\"bad\" OR \"byte\" OR \"\xE6\x97\xA5\xE6\x9C\xAC\"",
          "invalid bytes separate words and other scripts pass through");
}

void ScenarioRankingAndNormalisation(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: ranking and normalisation");
  auto engine = OpenEngine(path);
  const auto exact = Create(*engine, "Rust ownership prevents data races at compile time");
  const auto partial = Create(*engine, "Garbage collection trades pause time for simplicity");
  (void)Create(*engine, "Unrelated memory about gardening");

  const auto results = Keyword(*engine, "ownership data races");
  Require(!results.empty(), "keyword search must find the matching memory");
  Require(results.front().memory.id == exact, "exact match must rank first");
  Require(results.front().relevance == 1.0, "best hit must be normalised to 1.0");
  Require(!Contains(results, partial), "non-matching memory must not be returned");
  for (const auto& result : results) {
    Require(result.relevance > 0.0 && result.relevance <= 1.0, "relevance out of range");
    Require(result.sources == std::vector<mycelic::SearchSource>{mycelic::SearchSource::kKeyword},
            "keyword results must be attributed to the keyword channel");
  }
}

void ScenarioEngineOperators(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: engine operators");
  auto engine = OpenEngine(path);
  const auto go = Create(*engine, "Go routines enable concurrent programming");
  const auto vectors = Create(*engine, "Vector embeddings transform text into numerical representations");
  const auto mixed = Create(*engine, "Concurrent programming with vector clocks");

  const auto phrase = Keyword(*engine, "\"concurrent programming\"");
  Require(Contains(phrase, go) && Contains(phrase, mixed) && !Contains(phrase, vectors), "phrase query mismatch");

  const auto negated = Keyword(*engine, "concurrent NOT vector");
  Require(Contains(negated, go) && !Contains(negated, mixed), "NOT operator mismatch");

  const auto prefix = Keyword(*engine, "embed*");
  Require(prefix.size() == 1 && prefix.front().memory.id == vectors, "prefix query mismatch");
}

void ScenarioMalformedQueryFallsBack(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: malformed query falls back");
  auto engine = OpenEngine(path);
  const auto id = Create(*engine, "Programming in C++ with RAII");

  const auto results = Keyword(*engine, "programming AND");
  Require(results.size() == 1 && results.front().memory.id == id, "syntax error must retry as token OR query");

  Require(Keyword(*engine, "((").empty(), "a query with no tokens must return nothing");

  bool threw = false;
  try {
    (void)Keyword(*engine, "   ");
  } catch (const mycelic::ValidationError&) {
    threw = true;
  }
  Require(threw, "blank keyword query must be rejected");
}

void ScenarioTagsAndSourceAreSearchable(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: tags and source are searchable");
  auto engine = OpenEngine(path);
  const auto tagged = Create(*engine, "Standup notes", {"retrospective"});
  mycelic::CreateMemoryRequest request{};
  request.content = "Meeting summary";
  request.source = "whiteboard photo";
  request.session_id = "keyword";
  const auto sourced = engine->CreateMemory(request).id;

  Require(Contains(Keyword(*engine, "retrospective"), tagged), "tags must be indexed");
  Require(Contains(Keyword(*engine, "whiteboard"), sourced), "source must be indexed");
}

void ScenarioIndexFollowsWrites(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: index follows writes");
  auto engine = OpenEngine(path);
  const auto id = Create(*engine, "The capital of Australia is Sydney");
  Require(Contains(Keyword(*engine, "sydney"), id), "created memory must be searchable");

  (void)engine->UpdateMemory(id, mycelic::MemoryUpdate{.content = "The capital of Australia is Canberra"});
  Require(!Contains(Keyword(*engine, "sydney"), id), "old content must leave the index");
  Require(Contains(Keyword(*engine, "canberra"), id), "new content must enter the index");

  engine->DeleteMemory(id);
  Require(Keyword(*engine, "canberra").empty(), "deleted memory must leave the index");

  engine->CheckKeywordIndex();
  engine->RebuildKeywordIndex();
  engine->CheckKeywordIndex();
}

}  // namespace

int main() {
  try {
    mycelic::tests::Log("keyword_index_test: start");
    std::vector<std::filesystem::path> paths{};
    for (int i = 0; i < 5; ++i) {
      paths.push_back(UniquePath());
    }
    ScenarioBuildMatchQuery();
    ScenarioRankingAndNormalisation(paths[0]);
    ScenarioEngineOperators(paths[1]);
    ScenarioMalformedQueryFallsBack(paths[2]);
    ScenarioTagsAndSourceAreSearchable(paths[3]);
    ScenarioIndexFollowsWrites(paths[4]);
    for (const auto& path : paths) {
      RemoveDatabase(path);
    }
    mycelic::tests::Log("keyword_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    mycelic::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
