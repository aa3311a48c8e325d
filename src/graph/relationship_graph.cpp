#include "mycelic/relationship_graph.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/embeddings.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/memory_store.hpp"
#include "mycelic/sqlite_database.hpp"
#include "mycelic/vector_index.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <span>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mycelic {
namespace {

constexpr const char* kRelationshipColumns =
    "r.id, r.source_memory_id, r.target_memory_id, r.relationship_type, r.strength, r.context, r.auto_generated, "
    "r.created_at";

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("graph");
  return logger;
}

Relationship ReadRelationship(const Statement& stmt) {
  return Relationship{
      .id = stmt.ColumnText(0),
      .source_memory_id = stmt.ColumnText(1),
      .target_memory_id = stmt.ColumnText(2),
      .type = ParseRelationshipType(stmt.ColumnText(3)),
      .strength = stmt.ColumnDouble(4),
      .context = stmt.ColumnOptionalText(5),
      .auto_generated = stmt.ColumnInt64(6) != 0,
      .created_at = ParseTimestamp(stmt.ColumnText(7)),
  };
}

void ValidateStrength(double strength, const char* field) {
  if (!(strength >= 0.0 && strength <= 1.0)) {
    throw ValidationError(std::string(field) + " must be within [0, 1]");
  }
}

// Unordered pair key; '\x1F' cannot occur in an id.
std::string PairKey(const std::string& a, const std::string& b) {
  return a < b ? a + '\x1F' + b : b + '\x1F' + a;
}

void InsertRelationship(Connection& conn, const Relationship& relationship) {
  auto stmt = conn.Prepare(
      "INSERT INTO memory_relationships(id, source_memory_id, target_memory_id, relationship_type, strength, "
      "context, auto_generated, created_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
  stmt.BindText(1, relationship.id);
  stmt.BindText(2, relationship.source_memory_id);
  stmt.BindText(3, relationship.target_memory_id);
  stmt.BindText(4, std::string(ToString(relationship.type)));
  stmt.BindDouble(5, relationship.strength);
  stmt.BindText(6, relationship.context);
  stmt.BindInt64(7, relationship.auto_generated ? 1 : 0);
  stmt.BindText(8, FormatTimestamp(relationship.created_at));
  stmt.Step();
}

bool EdgeExists(Connection& conn, const std::string& a, const std::string& b) {
  auto stmt = conn.Prepare(
      "SELECT 1 FROM memory_relationships "
      "WHERE (source_memory_id = ?1 AND target_memory_id = ?2) OR (source_memory_id = ?2 AND target_memory_id = ?1) "
      "LIMIT 1;");
  stmt.BindText(1, a);
  stmt.BindText(2, b);
  return stmt.Step();
}

struct Neighbour {
  std::string relationship_id;
  std::string source_id;
  std::string target_id;
  RelationshipType type = RelationshipType::kReferences;
  double strength = 0.0;
};

}  // namespace

RelationshipGraph::RelationshipGraph(Database& db, const EmbeddingGateway& embeddings, GraphConfig config)
    : db_(db), embeddings_(embeddings), config_(config) {}

Relationship RelationshipGraph::CreateRelationship(const CreateRelationshipRequest& request) {
  ValidateStrength(request.strength, "strength");
  if (request.source_memory_id.empty() || request.target_memory_id.empty()) {
    throw ValidationError("relationship endpoints must not be empty");
  }
  return db_.Write([&](Connection& conn) {
    if (!MemoryExists(conn, request.source_memory_id)) {
      throw NotFoundError("source memory", request.source_memory_id);
    }
    if (!MemoryExists(conn, request.target_memory_id)) {
      throw NotFoundError("target memory", request.target_memory_id);
    }
    Relationship relationship{
        .id = NewId(),
        .source_memory_id = request.source_memory_id,
        .target_memory_id = request.target_memory_id,
        .type = request.type,
        .strength = request.strength,
        .context = request.context,
        .auto_generated = false,
        .created_at = db_.clock().Now(),
    };
    InsertRelationship(conn, relationship);
    return relationship;
  });
}

std::vector<Relationship> RelationshipGraph::GetRelationshipsForMemory(const std::string& memory_id) {
  return db_.Read([&](Connection& conn) {
    if (!MemoryExists(conn, memory_id)) {
      throw NotFoundError("memory", memory_id);
    }
    auto stmt = conn.Prepare(std::string("SELECT ") + kRelationshipColumns +
                             " FROM memory_relationships r WHERE r.source_memory_id = ?1 OR r.target_memory_id = ?1 "
                             "ORDER BY r.strength DESC, r.id ASC;");
    stmt.BindText(1, memory_id);
    std::vector<Relationship> out{};
    while (stmt.Step()) {
      out.push_back(ReadRelationship(stmt));
    }
    return out;
  });
}

std::vector<Relationship> RelationshipGraph::GetRelationshipsBetween(const std::string& first_id,
                                                                      const std::string& second_id) {
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string("SELECT ") + kRelationshipColumns +
                             " FROM memory_relationships r "
                             "WHERE (r.source_memory_id = ?1 AND r.target_memory_id = ?2) "
                             "OR (r.source_memory_id = ?2 AND r.target_memory_id = ?1) "
                             "ORDER BY r.strength DESC, r.id ASC;");
    stmt.BindText(1, first_id);
    stmt.BindText(2, second_id);
    std::vector<Relationship> out{};
    while (stmt.Step()) {
      out.push_back(ReadRelationship(stmt));
    }
    return out;
  });
}

std::vector<RelatedMemory> RelationshipGraph::FindRelated(const std::string& memory_id,
                                                          const FindRelatedOptions& options) {
  if (options.min_strength.has_value()) {
    ValidateStrength(*options.min_strength, "min_strength");
  }
  const int limit = options.limit.value_or(config_.find_related_limit);
  if (limit <= 0) {
    throw ValidationError("find related limit must be positive");
  }

  return db_.Read([&](Connection& conn) {
    if (!MemoryExists(conn, memory_id)) {
      throw NotFoundError("memory", memory_id);
    }
    auto stmt = conn.Prepare(std::string("SELECT ") + kRelationshipColumns +
                             " FROM memory_relationships r "
                             "WHERE (r.source_memory_id = ?1 OR r.target_memory_id = ?1) "
                             "AND (?2 IS NULL OR r.strength >= ?2) "
                             "AND (?3 IS NULL OR r.relationship_type = ?3) "
                             "ORDER BY r.strength DESC, r.id ASC;");
    stmt.BindText(1, memory_id);
    if (options.min_strength.has_value()) {
      stmt.BindDouble(2, *options.min_strength);
    } else {
      stmt.BindNull(2);
    }
    if (options.type.has_value()) {
      stmt.BindText(3, std::string(ToString(*options.type)));
    } else {
      stmt.BindNull(3);
    }

    std::vector<std::pair<std::string, Relationship>> strongest{};
    std::unordered_set<std::string> seen{};
    while (stmt.Step() && strongest.size() < static_cast<std::size_t>(limit)) {
      auto relationship = ReadRelationship(stmt);
      const auto& other = relationship.source_memory_id == memory_id ? relationship.target_memory_id
                                                                      : relationship.source_memory_id;
      if (other == memory_id || !seen.insert(other).second) {
        continue;
      }
      auto other_id = other;
      strongest.emplace_back(std::move(other_id), std::move(relationship));
    }

    std::vector<std::string> ids{};
    ids.reserve(strongest.size());
    for (const auto& [id, relationship] : strongest) {
      ids.push_back(id);
    }
    auto memories = LoadMemories(conn, ids);
    std::vector<RelatedMemory> out{};
    out.reserve(memories.size());
    std::size_t next = 0;
    for (auto& memory : memories) {
      while (next < strongest.size() && strongest[next].first != memory.id) {
        ++next;
      }
      if (next == strongest.size()) {
        break;
      }
      out.push_back(RelatedMemory{.memory = std::move(memory), .relationship = strongest[next].second});
    }
    return out;
  });
}

Graph RelationshipGraph::MapGraph(const std::string& root_id, std::optional<int> depth, const CancellationToken& token) {
  int max_depth = depth.value_or(config_.default_depth);
  if (max_depth < 0) {
    throw ValidationError("graph depth must not be negative");
  }
  max_depth = std::min(max_depth, config_.max_depth);

  return db_.Read([&](Connection& conn) {
    if (!MemoryExists(conn, root_id)) {
      throw NotFoundError("memory", root_id);
    }

    Graph graph{};
    graph.depth = max_depth;

    std::unordered_map<std::string, int> distance{{root_id, 0}};
    std::vector<std::string> order{root_id};
    std::deque<std::string> queue{root_id};
    std::unordered_set<std::string> edge_ids{};
    std::vector<Neighbour> edges{};

    auto neighbours = conn.Prepare(
        "SELECT r.id, r.source_memory_id, r.target_memory_id, r.relationship_type, r.strength "
        "FROM memory_relationships r WHERE r.source_memory_id = ?1 OR r.target_memory_id = ?1 "
        "ORDER BY r.strength DESC, r.id ASC;");

    while (!queue.empty()) {
      if (token.stop_requested()) {
        graph.truncated = true;
        break;
      }
      const auto current = std::move(queue.front());
      queue.pop_front();
      const int current_distance = distance.at(current);
      if (current_distance >= max_depth) {
        continue;
      }

      neighbours.Reset();
      neighbours.BindText(1, current);
      while (neighbours.Step()) {
        Neighbour edge{
            .relationship_id = neighbours.ColumnText(0),
            .source_id = neighbours.ColumnText(1),
            .target_id = neighbours.ColumnText(2),
            .type = ParseRelationshipType(neighbours.ColumnText(3)),
            .strength = neighbours.ColumnDouble(4),
        };
        const auto other = edge.source_id == current ? edge.target_id : edge.source_id;
        if (edge_ids.insert(edge.relationship_id).second) {
          edges.push_back(std::move(edge));
        }
        if (distance.emplace(other, current_distance + 1).second) {
          order.push_back(other);
          queue.push_back(other);
        }
      }
    }

    // Every recorded edge touches an expanded node, so both endpoints are
    // already in the node set.
    std::sort(edges.begin(), edges.end(), [](const Neighbour& lhs, const Neighbour& rhs) {
      if (lhs.strength != rhs.strength) {
        return lhs.strength > rhs.strength;
      }
      return lhs.relationship_id < rhs.relationship_id;
    });
    for (const auto& edge : edges) {
      graph.edges.push_back(GraphEdge{
          .source_id = edge.source_id,
          .target_id = edge.target_id,
          .type = edge.type,
          .strength = edge.strength,
      });
    }

    auto details = conn.Prepare("SELECT id, content, importance FROM memories WHERE id IN (SELECT value FROM json_each(?1));");
    details.BindText(1, JsonStringArray(order));
    std::unordered_map<std::string, std::pair<std::string, int>> rows{};
    while (details.Step()) {
      rows.emplace(details.ColumnText(0),
                   std::make_pair(details.ColumnText(1), static_cast<int>(details.ColumnInt64(2))));
    }
    graph.nodes.reserve(order.size());
    for (const auto& id : order) {
      const auto it = rows.find(id);
      if (it == rows.end()) {
        continue;
      }
      graph.nodes.push_back(GraphNode{
          .id = id,
          .distance = distance.at(id),
          .importance = it->second.second,
          .content = it->second.first,
      });
    }
    return graph;
  });
}

std::vector<Relationship> RelationshipGraph::DiscoverRelationships(const DiscoveryOptions& options,
                                                                   const CancellationToken& token) {
  if (options.limit <= 0) {
    throw ValidationError("discovery limit must be positive");
  }
  ValidateStrength(options.min_strength, "min_strength");
  if (!embeddings_.available()) {
    throw DependencyUnavailableError("relationship discovery requires an embedding provider");
  }

  struct Snapshot {
    std::vector<StoredVector> vectors;
    std::unordered_set<std::string> linked_pairs;
  };
  const auto snapshot = db_.Read([&](Connection& conn) {
    Snapshot out{};
    out.vectors = LoadRecentVectors(conn, config_.discovery_candidate_limit);
    std::vector<std::string> ids{};
    ids.reserve(out.vectors.size());
    for (const auto& item : out.vectors) {
      ids.push_back(item.memory_id);
    }
    auto stmt = conn.Prepare(
        "SELECT source_memory_id, target_memory_id FROM memory_relationships "
        "WHERE source_memory_id IN (SELECT value FROM json_each(?1)) "
        "AND target_memory_id IN (SELECT value FROM json_each(?1));");
    stmt.BindText(1, JsonStringArray(ids));
    while (stmt.Step()) {
      out.linked_pairs.insert(PairKey(stmt.ColumnText(0), stmt.ColumnText(1)));
    }
    return out;
  });

  struct Candidate {
    std::size_t first = 0;
    std::size_t second = 0;
    double similarity = 0.0;
  };
  std::vector<Candidate> candidates{};
  bool truncated = false;
  const auto& vectors = snapshot.vectors;
  for (std::size_t i = 0; i < vectors.size() && !truncated; ++i) {
    if (token.stop_requested()) {
      truncated = true;
      break;
    }
    const std::span<const float> lhs(vectors[i].embedding.data(), vectors[i].embedding.size());
    for (std::size_t j = i + 1; j < vectors.size(); ++j) {
      if (vectors[i].embedding.size() != vectors[j].embedding.size()) {
        continue;
      }
      if (snapshot.linked_pairs.count(PairKey(vectors[i].memory_id, vectors[j].memory_id)) != 0) {
        continue;
      }
      const std::span<const float> rhs(vectors[j].embedding.data(), vectors[j].embedding.size());
      const double similarity = std::clamp(static_cast<double>(CosineSimilarity(lhs, rhs)), 0.0, 1.0);
      if (similarity >= options.min_strength) {
        candidates.push_back(Candidate{.first = i, .second = j, .similarity = similarity});
      }
    }
  }

  std::sort(candidates.begin(), candidates.end(), [&](const Candidate& lhs, const Candidate& rhs) {
    if (lhs.similarity != rhs.similarity) {
      return lhs.similarity > rhs.similarity;
    }
    const auto lhs_key = PairKey(vectors[lhs.first].memory_id, vectors[lhs.second].memory_id);
    const auto rhs_key = PairKey(vectors[rhs.first].memory_id, vectors[rhs.second].memory_id);
    return lhs_key < rhs_key;
  });
  if (candidates.size() > static_cast<std::size_t>(options.limit)) {
    candidates.resize(static_cast<std::size_t>(options.limit));
  }
  if (candidates.empty()) {
    Log()->info("discovery scored {} memories, found no new pairs{}", vectors.size(), truncated ? " (cancelled)" : "");
    return {};
  }

  auto created = db_.Write([&](Connection& conn) {
    std::vector<Relationship> out{};
    const auto now = db_.clock().Now();
    for (const auto& candidate : candidates) {
      const auto& source = vectors[candidate.first].memory_id;
      const auto& target = vectors[candidate.second].memory_id;
      // Re-checked under the write lock so concurrent runs cannot duplicate.
      if (!MemoryExists(conn, source) || !MemoryExists(conn, target) || EdgeExists(conn, source, target)) {
        continue;
      }
      std::ostringstream context{};
      context.precision(3);
      context << "discovered by embedding similarity " << candidate.similarity;
      Relationship relationship{
          .id = NewId(),
          .source_memory_id = source,
          .target_memory_id = target,
          .type = RelationshipType::kSimilar,
          .strength = candidate.similarity,
          .context = context.str(),
          .auto_generated = true,
          .created_at = now,
      };
      InsertRelationship(conn, relationship);
      out.push_back(std::move(relationship));
    }
    return out;
  });
  Log()->info("discovery scored {} memories, created {} relationship(s){}",
              vectors.size(),
              created.size(),
              truncated ? " (cancelled)" : "");
  return created;
}

}  // namespace mycelic
