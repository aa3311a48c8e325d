#include "mycelic/vector_index.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/sqlite_database.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <cstring>

namespace mycelic {
namespace {

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float Norm(std::span<const float> v) {
  const auto dot = Dot(v, v);
  return std::sqrt(std::max(dot, 0.0F));
}

bool HitLess(const VectorHit& lhs, const VectorHit& rhs) {
  if (lhs.similarity != rhs.similarity) {
    return lhs.similarity > rhs.similarity;
  }
  return lhs.memory_id < rhs.memory_id;
}

}  // namespace

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  if (lhs.size() != rhs.size()) {
    return 0.0F;
  }
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return std::clamp(Dot(lhs, rhs) / (lhs_norm * rhs_norm), -1.0F, 1.0F);
}

std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding) {
  std::vector<std::byte> out(embedding.size() * sizeof(std::uint32_t));
  for (std::size_t i = 0; i < embedding.size(); ++i) {
    const auto bits = std::bit_cast<std::uint32_t>(embedding[i]);
    for (std::size_t b = 0; b < sizeof(bits); ++b) {
      out[i * sizeof(bits) + b] = static_cast<std::byte>((bits >> (8U * b)) & 0xFFU);
    }
  }
  return out;
}

std::vector<float> DecodeEmbedding(const std::vector<std::byte>& blob) {
  if (blob.size() % sizeof(std::uint32_t) != 0) {
    throw InternalError("stored embedding has a truncated component (" + std::to_string(blob.size()) + " bytes)");
  }
  std::vector<float> out(blob.size() / sizeof(std::uint32_t));
  for (std::size_t i = 0; i < out.size(); ++i) {
    std::uint32_t bits = 0;
    for (std::size_t b = 0; b < sizeof(bits); ++b) {
      bits |= static_cast<std::uint32_t>(std::to_integer<unsigned>(blob[i * sizeof(bits) + b])) << (8U * b);
    }
    out[i] = std::bit_cast<float>(bits);
  }
  return out;
}

void StoreVector(Connection& conn,
                 const std::string& memory_id,
                 const std::vector<float>& embedding,
                 const std::string& model,
                 Timestamp now) {
  const auto blob = EncodeEmbedding(embedding);
  auto update = conn.Prepare("UPDATE memories SET embedding = ?2 WHERE id = ?1;");
  update.BindText(1, memory_id);
  update.BindBlob(2, blob.data(), blob.size());
  update.Step();
  if (conn.Changes() == 0) {
    throw NotFoundError("memory", memory_id);
  }

  auto upsert = conn.Prepare(
      "INSERT INTO vector_metadata(memory_id, vector_index, embedding_model, embedding_dimension, last_updated) "
      "SELECT id, seq, ?2, ?3, ?4 FROM memories WHERE id = ?1 "
      "ON CONFLICT(memory_id) DO UPDATE SET vector_index = excluded.vector_index, "
      "embedding_model = excluded.embedding_model, embedding_dimension = excluded.embedding_dimension, "
      "last_updated = excluded.last_updated;");
  upsert.BindText(1, memory_id);
  upsert.BindText(2, model);
  upsert.BindInt64(3, static_cast<std::int64_t>(embedding.size()));
  upsert.BindText(4, FormatTimestamp(now));
  upsert.Step();
}

void RemoveVector(Connection& conn, const std::string& memory_id) {
  auto clear = conn.Prepare("UPDATE memories SET embedding = NULL WHERE id = ?1;");
  clear.BindText(1, memory_id);
  clear.Step();
  auto remove = conn.Prepare("DELETE FROM vector_metadata WHERE memory_id = ?1;");
  remove.BindText(1, memory_id);
  remove.Step();
}

std::optional<VectorMetadata> GetVectorMetadata(Connection& conn, const std::string& memory_id) {
  auto stmt = conn.Prepare(
      "SELECT memory_id, vector_index, embedding_model, embedding_dimension, last_updated "
      "FROM vector_metadata WHERE memory_id = ?1;");
  stmt.BindText(1, memory_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return VectorMetadata{
      .memory_id = stmt.ColumnText(0),
      .vector_index = stmt.ColumnInt64(1),
      .embedding_model = stmt.ColumnText(2),
      .embedding_dimension = static_cast<int>(stmt.ColumnInt64(3)),
      .last_updated = ParseTimestamp(stmt.ColumnText(4)),
  };
}

std::vector<VectorHit> SearchVectors(Connection& conn, const std::vector<float>& query, double min_similarity, int top_k) {
  if (top_k <= 0 || query.empty()) {
    return {};
  }
  auto stmt = conn.Prepare(
      "SELECT m.id, m.embedding FROM memories m "
      "JOIN vector_metadata v ON v.memory_id = m.id "
      "WHERE m.embedding IS NOT NULL AND v.embedding_dimension = ?1;");
  stmt.BindInt64(1, static_cast<std::int64_t>(query.size()));

  const auto query_span = std::span<const float>(query.data(), query.size());
  std::vector<VectorHit> hits{};
  while (stmt.Step()) {
    const auto candidate = DecodeEmbedding(stmt.ColumnBlob(1));
    if (candidate.size() != query.size()) {
      continue;
    }
    const float similarity = CosineSimilarity(query_span, std::span<const float>(candidate.data(), candidate.size()));
    if (static_cast<double>(similarity) < min_similarity) {
      continue;
    }
    hits.push_back(VectorHit{.memory_id = stmt.ColumnText(0), .similarity = similarity});
  }

  std::sort(hits.begin(), hits.end(), HitLess);
  if (hits.size() > static_cast<std::size_t>(top_k)) {
    hits.resize(static_cast<std::size_t>(top_k));
  }
  return hits;
}

std::vector<StoredVector> LoadRecentVectors(Connection& conn, int limit) {
  if (limit <= 0) {
    return {};
  }
  auto stmt = conn.Prepare(
      "SELECT m.id, m.embedding FROM memories m "
      "JOIN vector_metadata v ON v.memory_id = m.id "
      "WHERE m.embedding IS NOT NULL "
      "ORDER BY m.created_at DESC, m.id ASC LIMIT ?1;");
  stmt.BindInt64(1, limit);
  std::vector<StoredVector> out{};
  while (stmt.Step()) {
    out.push_back(StoredVector{.memory_id = stmt.ColumnText(0), .embedding = DecodeEmbedding(stmt.ColumnBlob(1))});
  }
  return out;
}

}  // namespace mycelic
