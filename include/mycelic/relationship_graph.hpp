#pragma once

#include "mycelic/cancellation.hpp"
#include "mycelic/config.hpp"
#include "mycelic/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mycelic {

class Database;
class EmbeddingGateway;

class RelationshipGraph {
 public:
  RelationshipGraph(Database& db, const EmbeddingGateway& embeddings, GraphConfig config);

  // Repeated calls create additional edges.
  Relationship CreateRelationship(const CreateRelationshipRequest& request);
  std::vector<Relationship> GetRelationshipsForMemory(const std::string& memory_id);
  std::vector<Relationship> GetRelationshipsBetween(const std::string& first_id, const std::string& second_id);

  // Neighbours over edges in either direction, strongest edge first. A
  // neighbour reached by several edges is reported once.
  std::vector<RelatedMemory> FindRelated(const std::string& memory_id, const FindRelatedOptions& options = {});

  // Breadth-first over edges in either direction. depth defaults to
  // GraphConfig::default_depth and is clamped to max_depth; nodes come back
  // in discovery order with their shortest hop count.
  Graph MapGraph(const std::string& root_id,
                 std::optional<int> depth = std::nullopt,
                 const CancellationToken& token = {});

  // Links the most similar pairs of embedded memories that have no edge yet
  // with auto-generated "similar" edges. Re-running on an unchanged corpus
  // adds nothing.
  std::vector<Relationship> DiscoverRelationships(const DiscoveryOptions& options = {},
                                                  const CancellationToken& token = {});

 private:
  Database& db_;
  const EmbeddingGateway& embeddings_;
  GraphConfig config_;
};

}  // namespace mycelic
