#pragma once

#include "mycelic/config.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mycelic {

struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<int> dimensions;
  std::optional<bool> normalized;
};

// Text to fixed-length vector. Implementations may be called from several
// threads at once.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual bool available() const { return true; }
  virtual int dimensions() const = 0;
  virtual bool normalize() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
};

// Stand-in used when no backend is configured.
class UnavailableEmbeddingProvider final : public EmbeddingProvider {
 public:
  bool available() const override { return false; }
  int dimensions() const override { return 0; }
  bool normalize() const override { return false; }
  std::optional<EmbeddingIdentity> identity() const override { return std::nullopt; }
  std::vector<float> Embed(const std::string& text) override;
};

// Offline embedder for deployments without a model backend. Words (as the
// keyword index tokenizes them) and adjacent word pairs are hashed into signed
// buckets with sublinear term weighting, then L2-normalised. Vectors carry
// lexical overlap only; word order matters through the pairs. Results are
// memoised in a bounded least-recently-used table.
class HashingEmbeddingProvider final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;
  [[nodiscard]] bool is_memoized(const std::string& text) const;

 private:
  struct MemoEntry {
    std::vector<float> embedding;
    std::list<std::string>::iterator recency;
  };

  std::vector<float> Compute(const std::string& text) const;
  void Remember(const std::string& text, const std::vector<float>& embedding);

  int dimensions_;
  std::size_t memoization_capacity_ = 0;
  mutable std::mutex memo_mutex_{};
  // Front is the most recently used text.
  std::list<std::string> recency_{};
  std::unordered_map<std::string, MemoEntry> memo_{};
};

// The one place the engine asks whether embeddings can be produced. Every
// failure mode of the provider (absent, throwing, slow, wrong shape) comes
// out as DependencyUnavailableError.
class EmbeddingGateway {
 public:
  EmbeddingGateway(std::shared_ptr<EmbeddingProvider> provider, EmbeddingConfig config);

  [[nodiscard]] bool available() const;
  int dimensions() const;
  // Model label recorded in vector metadata.
  std::string model() const;

  std::vector<float> Embed(const std::string& text) const;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) const;

 private:
  void CheckShape(const std::vector<float>& embedding) const;

  std::shared_ptr<EmbeddingProvider> provider_;
  EmbeddingConfig config_;
};

}  // namespace mycelic
