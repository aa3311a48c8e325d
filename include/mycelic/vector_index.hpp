#pragma once

#include "mycelic/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mycelic {

class Connection;

struct VectorHit {
  std::string memory_id;
  float similarity = 0.0F;
};

struct StoredVector {
  std::string memory_id;
  std::vector<float> embedding;
};

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs);

// Little-endian IEEE-754 floats, four bytes per component.
std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding);
std::vector<float> DecodeEmbedding(const std::vector<std::byte>& blob);

// Writes the vector onto the memory row and upserts its metadata. The
// vector position is the memory's row sequence number.
void StoreVector(Connection& conn,
                 const std::string& memory_id,
                 const std::vector<float>& embedding,
                 const std::string& model,
                 Timestamp now);
void RemoveVector(Connection& conn, const std::string& memory_id);
std::optional<VectorMetadata> GetVectorMetadata(Connection& conn, const std::string& memory_id);

// Cosine scan over every memory with vector metadata. Vectors whose
// dimension differs from the query are skipped.
std::vector<VectorHit> SearchVectors(Connection& conn, const std::vector<float>& query, double min_similarity, int top_k);

// Most recently created memories that carry a vector, newest first.
std::vector<StoredVector> LoadRecentVectors(Connection& conn, int limit);

}  // namespace mycelic
