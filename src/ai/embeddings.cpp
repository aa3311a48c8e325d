#include "mycelic/embeddings.hpp"

#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/text.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <string_view>
#include <thread>
#include <utility>

namespace mycelic {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr double kPairWeight = 0.5;

// FNV-1a finished with the splitmix64 mixer.
std::uint64_t HashFeature(std::string_view feature) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : feature) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  hash ^= hash >> 30U;
  hash *= 0xBF58476D1CE4E5B9ULL;
  hash ^= hash >> 27U;
  hash *= 0x94D049BB133111EBULL;
  hash ^= hash >> 31U;
  return hash;
}

// "w:" word and "p:" adjacent-pair features with their raw counts.
std::map<std::string, int> ExtractFeatures(const std::string& text) {
  const auto words = TokenizeWords(text);
  std::map<std::string, int> features{};
  for (std::size_t i = 0; i < words.size(); ++i) {
    ++features["w:" + words[i]];
    if (i + 1 < words.size()) {
      ++features["p:" + words[i] + ' ' + words[i + 1]];
    }
  }
  return features;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("ai");
  return logger;
}

// Runs fn on a detached thread so a hung provider cannot pin the caller past
// the timeout. The thread keeps the provider alive through its shared_ptr.
template <typename Result, typename Fn>
Result RunBounded(std::chrono::milliseconds timeout, Fn fn) {
  auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();
  std::thread([promise, fn = std::move(fn)]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    throw DependencyUnavailableError("embedding provider timed out after " + std::to_string(timeout.count()) + " ms");
  }
  try {
    return future.get();
  } catch (const DependencyUnavailableError&) {
    throw;
  } catch (const std::exception& ex) {
    throw DependencyUnavailableError(std::string("embedding provider failed: ") + ex.what());
  } catch (...) {
    throw DependencyUnavailableError("embedding provider failed with a non-standard exception");
  }
}

}  // namespace

std::vector<float> UnavailableEmbeddingProvider::Embed(const std::string& /*text*/) {
  throw DependencyUnavailableError("no embedding provider is configured");
}

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw ValidationError("HashingEmbeddingProvider dimensions must be positive");
  }
}

int HashingEmbeddingProvider::dimensions() const {
  return dimensions_;
}

bool HashingEmbeddingProvider::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbeddingProvider::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("mycelic"),
      .model = std::string("hashed-ngrams-") + std::to_string(dimensions_),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbeddingProvider::Compute(const std::string& text) const {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);
  for (const auto& [feature, count] : ExtractFeatures(text)) {
    const auto hash = HashFeature(feature);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const double base = feature[0] == 'p' ? kPairWeight : 1.0;
    const double weight = base * (1.0 + std::log(static_cast<double>(count)));
    embedding[index] += static_cast<float>(((hash >> 63U) != 0U) ? -weight : weight);
  }
  NormalizeL2(embedding);
  return embedding;
}

void HashingEmbeddingProvider::Remember(const std::string& text, const std::vector<float>& embedding) {
  std::lock_guard<std::mutex> lock(memo_mutex_);
  if (memo_.find(text) != memo_.end()) {
    return;
  }
  while (memo_.size() >= memoization_capacity_ && !recency_.empty()) {
    memo_.erase(recency_.back());
    recency_.pop_back();
  }
  recency_.push_front(text);
  memo_.emplace(text, MemoEntry{.embedding = embedding, .recency = recency_.begin()});
}

std::vector<float> HashingEmbeddingProvider::Embed(const std::string& text) {
  if (memoization_capacity_ == 0) {
    return Compute(text);
  }
  {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    const auto cached = memo_.find(text);
    if (cached != memo_.end()) {
      recency_.splice(recency_.begin(), recency_, cached->second.recency);
      return cached->second.embedding;
    }
  }
  auto embedding = Compute(text);
  Remember(text, embedding);
  return embedding;
}

std::vector<std::vector<float>> HashingEmbeddingProvider::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbeddingProvider::cache_size() const {
  std::lock_guard<std::mutex> lock(memo_mutex_);
  return memo_.size();
}

bool HashingEmbeddingProvider::is_memoized(const std::string& text) const {
  std::lock_guard<std::mutex> lock(memo_mutex_);
  return memo_.find(text) != memo_.end();
}

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<EmbeddingProvider> provider, EmbeddingConfig config)
    : provider_(provider != nullptr ? std::move(provider) : std::make_shared<UnavailableEmbeddingProvider>()),
      config_(std::move(config)) {}

bool EmbeddingGateway::available() const {
  return provider_->available() && provider_->dimensions() > 0;
}

int EmbeddingGateway::dimensions() const {
  return provider_->dimensions();
}

std::string EmbeddingGateway::model() const {
  const auto identity = provider_->identity();
  if (identity.has_value() && identity->model.has_value()) {
    return *identity->model;
  }
  return config_.model;
}

void EmbeddingGateway::CheckShape(const std::vector<float>& embedding) const {
  if (embedding.size() != static_cast<std::size_t>(provider_->dimensions())) {
    throw DependencyUnavailableError("embedding provider returned " + std::to_string(embedding.size()) +
                                     " dimensions, expected " + std::to_string(provider_->dimensions()));
  }
  for (const auto x : embedding) {
    if (!std::isfinite(x)) {
      throw DependencyUnavailableError("embedding provider returned a non-finite component");
    }
  }
}

std::vector<float> EmbeddingGateway::Embed(const std::string& text) const {
  if (!available()) {
    throw DependencyUnavailableError("no embedding provider is configured");
  }
  auto provider = provider_;
  auto embedding = RunBounded<std::vector<float>>(config_.timeout, [provider, text]() { return provider->Embed(text); });
  CheckShape(embedding);
  return embedding;
}

std::vector<std::vector<float>> EmbeddingGateway::EmbedBatch(const std::vector<std::string>& texts) const {
  if (!available()) {
    throw DependencyUnavailableError("no embedding provider is configured");
  }
  if (texts.empty()) {
    return {};
  }
  std::vector<std::vector<float>> out{};
  if (auto batch = std::dynamic_pointer_cast<BatchEmbeddingProvider>(provider_); batch != nullptr) {
    out = RunBounded<std::vector<std::vector<float>>>(config_.timeout,
                                                      [batch, texts]() { return batch->EmbedBatch(texts); });
    if (out.size() != texts.size()) {
      throw DependencyUnavailableError("embedding provider returned " + std::to_string(out.size()) +
                                       " vectors for " + std::to_string(texts.size()) + " texts");
    }
  } else {
    out.reserve(texts.size());
    for (const auto& text : texts) {
      out.push_back(Embed(text));
    }
    return out;
  }
  for (const auto& embedding : out) {
    CheckShape(embedding);
  }
  Log()->debug("embedded batch of {} text(s)", out.size());
  return out;
}

}  // namespace mycelic
