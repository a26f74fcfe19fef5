#include "fuzzcache/embeddings.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fuzzcache {

std::size_t EmbeddingKeyHash::operator()(const EmbeddingKey& key) const {
  const auto text_hash = std::hash<std::string>{}(key.text);
  const auto model_hash = std::hash<std::string>{}(key.model);
  return text_hash ^ (model_hash + 0x9e3779b97f4a7c15ULL + (text_hash << 6U) + (text_hash >> 2U));
}

FunctionEmbeddingProvider::FunctionEmbeddingProvider(Function fn) : fn_(std::move(fn)) {
  if (!fn_) {
    throw std::invalid_argument("FunctionEmbeddingProvider requires a callable");
  }
}

std::vector<float> FunctionEmbeddingProvider::Embed(const std::string& text, const std::string& model) {
  return fn_(text, model);
}

Embeddings::Embeddings(std::shared_ptr<EmbeddingProvider> provider) : provider_(std::move(provider)) {
  if (provider_ == nullptr) {
    throw std::invalid_argument("Embeddings requires an embedding provider");
  }
}

std::vector<float> Embeddings::Embed(const std::string& text, const std::string& model) {
  EmbeddingKey key{text, model};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(key);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  auto embedding = provider_->Embed(text, model);

  std::lock_guard<std::mutex> lock(mutex_);
  memoized_embeddings_.insert_or_assign(std::move(key), embedding);
  return embedding;
}

std::size_t Embeddings::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

}  // namespace fuzzcache
