#include "mycelic/embeddings.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/memory_engine.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
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
  return std::filesystem::temp_directory_path() / ("mycelic_graph_test_" + std::to_string(static_cast<long long>(now)) +
                                                   "_" + std::to_string(++counter) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

// Fixed vectors per content string, so similarities are known exactly.
class TableEmbedder final : public mycelic::EmbeddingProvider {
 public:
  explicit TableEmbedder(std::map<std::string, std::vector<float>> table) : table_(std::move(table)) {}

  int dimensions() const override { return 3; }
  bool normalize() const override { return false; }
  std::optional<mycelic::EmbeddingIdentity> identity() const override {
    return mycelic::EmbeddingIdentity{.model = std::string("table-3")};
  }

  std::vector<float> Embed(const std::string& text) override {
    const auto it = table_.find(text);
    if (it == table_.end()) {
      return {0.0F, 0.0F, 1.0F};
    }
    return it->second;
  }

 private:
  std::map<std::string, std::vector<float>> table_;
};

std::shared_ptr<TableEmbedder> ClusterEmbedder() {
  return std::make_shared<TableEmbedder>(std::map<std::string, std::vector<float>>{
      {"alpha one", {1.0F, 0.0F, 0.0F}},
      {"alpha two", {0.9F, 0.1F, 0.0F}},
      {"beta one", {0.0F, 1.0F, 0.0F}},
      {"beta two", {0.0F, 0.95F, 0.3F}},
  });
}

std::unique_ptr<mycelic::MemoryEngine> OpenEngine(const std::filesystem::path& path,
                                                  std::shared_ptr<mycelic::EmbeddingProvider> provider = nullptr) {
  mycelic::EngineConfig config{};
  config.database.path = path;
  return mycelic::MemoryEngine::Open(config, std::move(provider));
}

std::string Create(mycelic::MemoryEngine& engine, const std::string& content, int importance = 5) {
  mycelic::CreateMemoryRequest request{};
  request.content = content;
  request.importance = importance;
  request.session_id = "graph";
  return engine.CreateMemory(request).id;
}

mycelic::Relationship Relate(mycelic::MemoryEngine& engine,
                             const std::string& source,
                             const std::string& target,
                             mycelic::RelationshipType type,
                             double strength) {
  return engine.CreateRelationship(mycelic::CreateRelationshipRequest{
      .source_memory_id = source,
      .target_memory_id = target,
      .type = type,
      .strength = strength,
  });
}

void ScenarioCreateAndValidate(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: create and validate");
  auto engine = OpenEngine(path);
  const auto a = Create(*engine, "a");
  const auto b = Create(*engine, "b");

  const auto created = Relate(*engine, a, b, mycelic::RelationshipType::kExpands, 0.6);
  Require(!created.id.empty() && !created.auto_generated, "manual relationship fields mismatch");
  Require(mycelic::ParseRelationshipType("enables") == mycelic::RelationshipType::kEnables, "type parse mismatch");

  bool bad_type = false;
  try {
    (void)mycelic::ParseRelationshipType("befriends");
  } catch (const mycelic::ConstraintError&) {
    bad_type = true;
  }
  Require(bad_type, "unknown relationship type must be a constraint error");

  for (const double strength : {-0.1, 1.01}) {
    bool threw = false;
    try {
      (void)Relate(*engine, a, b, mycelic::RelationshipType::kSimilar, strength);
    } catch (const mycelic::ValidationError&) {
      threw = true;
    }
    Require(threw, "strength outside [0, 1] must be rejected");
  }

  std::string missing_entity{};
  try {
    (void)Relate(*engine, a, "ghost", mycelic::RelationshipType::kCauses, 0.5);
  } catch (const mycelic::NotFoundError& ex) {
    missing_entity = ex.entity();
  }
  Require(missing_entity == "target memory", "not found error must name the missing endpoint");

  (void)Relate(*engine, b, a, mycelic::RelationshipType::kContradicts, 0.2);
  const auto between = engine->GetRelationshipsBetween(b, a);
  Require(between.size() == 2, "relationships in both directions expected");
  Require(between[0].strength == 0.6, "relationships must be ordered by strength");
  Require(engine->GetRelationships(a).size() == 2, "memory must see edges in both directions");
}

void ScenarioFindRelatedStrongestEdge(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: find related strongest edge");
  auto engine = OpenEngine(path);
  const auto a = Create(*engine, "a");
  const auto b = Create(*engine, "b");
  const auto c = Create(*engine, "c");
  (void)Relate(*engine, a, b, mycelic::RelationshipType::kReferences, 0.3);
  (void)Relate(*engine, b, a, mycelic::RelationshipType::kSequential, 0.9);
  (void)Relate(*engine, c, a, mycelic::RelationshipType::kReferences, 0.5);
  (void)Relate(*engine, a, a, mycelic::RelationshipType::kReferences, 1.0);

  const auto related = engine->FindRelated(a);
  Require(related.size() == 2, "each neighbour must be reported once and self loops skipped");
  Require(related[0].memory.id == b && related[0].relationship.strength == 0.9, "strongest edge must win");
  Require(related[1].memory.id == c, "weaker neighbour must follow");

  const auto strong = engine->FindRelated(a, mycelic::FindRelatedOptions{.min_strength = 0.6});
  Require(strong.size() == 1 && strong[0].memory.id == b, "min_strength filter mismatch");

  const auto typed = engine->FindRelated(a, mycelic::FindRelatedOptions{.type = mycelic::RelationshipType::kReferences});
  Require(typed.size() == 2 && typed[0].memory.id == c && typed[1].memory.id == b, "type filter mismatch");

  const auto limited = engine->FindRelated(a, mycelic::FindRelatedOptions{.limit = 1});
  Require(limited.size() == 1, "limit mismatch");
}

void ScenarioDeleteCascades(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: delete cascades");
  auto engine = OpenEngine(path);
  const auto a = Create(*engine, "a");
  const auto b = Create(*engine, "b");
  (void)Relate(*engine, a, b, mycelic::RelationshipType::kReferences, 0.7);
  Require(engine->FindRelated(b).size() == 1, "relationship must be visible from the target");

  engine->DeleteMemory(a);
  Require(engine->FindRelated(b).empty(), "deleting an endpoint must remove the relationship");
  Require(engine->GetRelationships(b).empty(), "no dangling relationship may remain");
}

void ScenarioMapGraphChain(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: map graph chain");
  auto engine = OpenEngine(path);
  const auto a = Create(*engine, "a", 9);
  const auto b = Create(*engine, "b");
  const auto c = Create(*engine, "c");
  const auto d = Create(*engine, "d");
  (void)Relate(*engine, a, b, mycelic::RelationshipType::kSequential, 0.9);
  (void)Relate(*engine, b, c, mycelic::RelationshipType::kSequential, 0.8);
  (void)Relate(*engine, c, d, mycelic::RelationshipType::kSequential, 0.7);

  const auto full = engine->MapGraph(a, 3);
  Require(full.nodes.size() == 4 && full.edges.size() == 3, "depth 3 must reach the whole chain");
  const std::vector<std::string> expected{a, b, c, d};
  for (std::size_t i = 0; i < expected.size(); ++i) {
    Require(full.nodes[i].id == expected[i], "nodes must come back in discovery order");
    Require(full.nodes[i].distance == static_cast<int>(i), "node distance mismatch");
  }
  Require(full.nodes[0].importance == 9 && full.nodes[0].content == "a", "node details mismatch");
  Require(!full.truncated, "uncancelled traversal must not be truncated");

  const auto shallow = engine->MapGraph(a, 1);
  Require(shallow.nodes.size() == 2 && shallow.nodes[1].id == b, "depth 1 must stop at the first hop");
  Require(shallow.edges.size() == 1, "depth 1 must report one edge");

  const auto from_middle = engine->MapGraph(c);
  Require(from_middle.depth == 2 && from_middle.nodes.size() == 4, "default depth must be 2 over both directions");

  Require(engine->MapGraph(a, 50).depth == 5, "depth must be clamped to the maximum");
  Require(engine->MapGraph(a, 0).nodes.size() == 1, "depth 0 returns only the root");

  bool negative = false;
  try {
    (void)engine->MapGraph(a, -1);
  } catch (const mycelic::ValidationError&) {
    negative = true;
  }
  Require(negative, "negative depth must be rejected");

  mycelic::CancellationToken token{};
  token.Cancel();
  const auto cancelled = engine->MapGraph(a, 3, token);
  Require(cancelled.truncated && cancelled.nodes.size() == 1, "cancelled traversal must return the partial graph");
}

void ScenarioMapGraphCycle(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: map graph cycle");
  auto engine = OpenEngine(path);
  const auto a = Create(*engine, "a");
  const auto b = Create(*engine, "b");
  const auto c = Create(*engine, "c");
  (void)Relate(*engine, a, b, mycelic::RelationshipType::kReferences, 0.5);
  (void)Relate(*engine, b, c, mycelic::RelationshipType::kReferences, 0.5);
  (void)Relate(*engine, c, a, mycelic::RelationshipType::kReferences, 0.5);

  const auto graph = engine->MapGraph(a, 5);
  Require(graph.nodes.size() == 3, "cycle must not revisit nodes");
  Require(graph.edges.size() == 3, "each edge must be reported once");
  Require(graph.nodes[1].distance == 1 && graph.nodes[2].distance == 1, "both cycle neighbours are one hop away");
}

void ScenarioDiscoveryIsIdempotent(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: discovery is idempotent");
  auto engine = OpenEngine(path, ClusterEmbedder());
  const auto alpha_one = Create(*engine, "alpha one");
  const auto alpha_two = Create(*engine, "alpha two");
  const auto beta_one = Create(*engine, "beta one");
  const auto beta_two = Create(*engine, "beta two");

  const auto first = engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 10, .min_strength = 0.7});
  Require(first.size() == 2, "two similar pairs expected");
  for (const auto& relationship : first) {
    Require(relationship.auto_generated, "discovered edges must be marked auto-generated");
    Require(relationship.type == mycelic::RelationshipType::kSimilar, "discovered edges must be similar edges");
    Require(relationship.strength >= 0.7 && relationship.strength <= 1.0, "strength must be the similarity");
    Require(relationship.context.has_value(), "discovered edges must explain themselves");
  }
  Require(!engine->GetRelationshipsBetween(alpha_one, alpha_two).empty(), "alpha pair must be linked");
  Require(!engine->GetRelationshipsBetween(beta_one, beta_two).empty(), "beta pair must be linked");
  Require(engine->GetRelationshipsBetween(alpha_one, beta_one).empty(), "dissimilar pair must not be linked");

  const auto second = engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 10, .min_strength = 0.7});
  Require(second.empty(), "second run on an unchanged corpus must add nothing");
  Require(engine->Stats().relationship_count == 2, "relationship count must be unchanged");
}

void ScenarioDiscoveryLimitAndCancellation(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: discovery limit and cancellation");
  auto engine = OpenEngine(path, ClusterEmbedder());
  const auto alpha_one = Create(*engine, "alpha one");
  const auto alpha_two = Create(*engine, "alpha two");
  (void)Create(*engine, "beta one");
  (void)Create(*engine, "beta two");

  mycelic::CancellationToken token{};
  token.Cancel();
  Require(engine->DiscoverRelationships({}, token).empty(), "cancelled discovery must not write");

  const auto best = engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 1, .min_strength = 0.7});
  Require(best.size() == 1, "limit must cap discovered edges");
  const bool alpha_pair = (best[0].source_memory_id == alpha_one && best[0].target_memory_id == alpha_two) ||
                          (best[0].source_memory_id == alpha_two && best[0].target_memory_id == alpha_one);
  Require(alpha_pair, "most similar pair must be linked first");

  bool threw = false;
  try {
    (void)engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 0});
  } catch (const mycelic::ValidationError&) {
    threw = true;
  }
  Require(threw, "non-positive limit must be rejected");
}

void ScenarioDeadlinesStopGraphWork(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: deadlines stop graph work");
  auto engine = OpenEngine(path, ClusterEmbedder());
  const auto alpha_one = Create(*engine, "alpha one");
  const auto alpha_two = Create(*engine, "alpha two");
  const auto beta_one = Create(*engine, "beta one");
  (void)Create(*engine, "beta two");
  (void)Relate(*engine, alpha_one, alpha_two, mycelic::RelationshipType::kExpands, 0.6);
  (void)Relate(*engine, alpha_two, beta_one, mycelic::RelationshipType::kReferences, 0.4);

  const auto expired =
      mycelic::CancellationToken::WithDeadline(mycelic::CancellationToken::Clock::now() - std::chrono::seconds(1));
  const auto stopped = engine->MapGraph(alpha_one, 3, expired);
  Require(stopped.truncated, "traversal past its deadline must be truncated");
  Require(stopped.nodes.size() == 1 && stopped.nodes[0].id == alpha_one, "only the root precedes the deadline check");
  Require(stopped.edges.empty(), "no edges may be reported after the deadline");
  Require(engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 10, .min_strength = 0.7}, expired).empty(),
          "discovery past its deadline must not write");
  Require(engine->Stats().relationship_count == 2, "expired discovery must leave relationships untouched");

  const auto elapsed = mycelic::CancellationToken::WithTimeout(std::chrono::milliseconds(-1));
  Require(engine->MapGraph(alpha_one, 3, elapsed).truncated, "elapsed timeout must truncate the traversal");

  const auto generous = mycelic::CancellationToken::WithTimeout(std::chrono::minutes(5));
  const auto full = engine->MapGraph(alpha_one, 3, generous);
  Require(!full.truncated && full.nodes.size() == 3, "traversal within its timeout must finish");
  const auto found =
      engine->DiscoverRelationships(mycelic::DiscoveryOptions{.limit = 10, .min_strength = 0.7}, generous);
  Require(found.size() == 1, "discovery within its timeout must link the beta pair");
}

void ScenarioDiscoveryRequiresProvider(const std::filesystem::path& path) {
  mycelic::tests::Log("scenario: discovery requires provider");
  auto engine = OpenEngine(path);
  (void)Create(*engine, "a");
  bool threw = false;
  try {
    (void)engine->DiscoverRelationships();
  } catch (const mycelic::DependencyUnavailableError&) {
    threw = true;
  }
  Require(threw, "discovery without embeddings must report the missing dependency");
}

}  // namespace

int main() {
  try {
    mycelic::tests::Log("relationship_graph_test: start");
    std::vector<std::filesystem::path> paths{};
    for (int i = 0; i < 9; ++i) {
      paths.push_back(UniquePath());
    }
    ScenarioCreateAndValidate(paths[0]);
    ScenarioFindRelatedStrongestEdge(paths[1]);
    ScenarioDeleteCascades(paths[2]);
    ScenarioMapGraphChain(paths[3]);
    ScenarioMapGraphCycle(paths[4]);
    ScenarioDiscoveryIsIdempotent(paths[5]);
    ScenarioDiscoveryLimitAndCancellation(paths[6]);
    ScenarioDiscoveryRequiresProvider(paths[7]);
    ScenarioDeadlinesStopGraphWork(paths[8]);
    for (const auto& path : paths) {
      RemoveDatabase(path);
    }
    mycelic::tests::Log("relationship_graph_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    mycelic::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
