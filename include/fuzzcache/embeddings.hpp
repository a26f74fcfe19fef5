#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fuzzcache {

// Must tolerate concurrent and repeated calls for the same text.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> Embed(const std::string& text, const std::string& model) = 0;
};

class FunctionEmbeddingProvider final : public EmbeddingProvider {
 public:
  using Function = std::function<std::vector<float>(const std::string& text, const std::string& model)>;

  explicit FunctionEmbeddingProvider(Function fn);

  std::vector<float> Embed(const std::string& text, const std::string& model) override;

 private:
  Function fn_;
};

class HashingEmbeddingProvider final : public EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(int dimensions = 384, bool normalize = true);

  int dimensions() const;
  bool normalize() const;
  std::vector<float> Embed(const std::string& text, const std::string& model) override;

 private:
  int dimensions_;
  bool normalize_;
};

struct EmbeddingKey {
  std::string text;
  std::string model;

  bool operator==(const EmbeddingKey& other) const = default;
};

struct EmbeddingKeyHash {
  std::size_t operator()(const EmbeddingKey& key) const;
};

// Per (text, model) memo; failures are not cached.
class Embeddings {
 public:
  explicit Embeddings(std::shared_ptr<EmbeddingProvider> provider);

  std::vector<float> Embed(const std::string& text, const std::string& model);
  [[nodiscard]] std::size_t cache_size() const;

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  std::unordered_map<EmbeddingKey, std::vector<float>, EmbeddingKeyHash> memoized_embeddings_{};
  mutable std::mutex mutex_{};
};

}  // namespace fuzzcache
