#include "fuzzcache/embeddings.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fuzzcache {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::uint64_t HashBytes(std::uint64_t hash, std::string_view bytes) {
  for (const unsigned char ch : bytes) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
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

}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions, bool normalize)
    : dimensions_(dimensions), normalize_(normalize) {
  if (dimensions_ <= 0) {
    throw std::invalid_argument("HashingEmbeddingProvider dimensions must be positive");
  }
}

int HashingEmbeddingProvider::dimensions() const {
  return dimensions_;
}

bool HashingEmbeddingProvider::normalize() const {
  return normalize_;
}

std::vector<float> HashingEmbeddingProvider::Embed(const std::string& text, const std::string& model) {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);

  // Seeding with the model name keeps vectors of different models in separate spaces.
  const auto seed = HashBytes(kFnvOffset, model);
  for (const auto& token : Tokenize(text)) {
    const auto hash = HashBytes(seed, token);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }

  if (normalize_) {
    NormalizeL2(embedding);
  }
  return embedding;
}

}  // namespace fuzzcache
