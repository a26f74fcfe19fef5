#pragma once

#include "fuzzcache/entry_store.hpp"
#include "fuzzcache/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fuzzcache {

using EmbedFn = std::function<std::vector<float>(const std::string& text, const std::string& model)>;

std::string NormalizeUrl(const std::string& raw, const ExactUrlSpec& spec);

// Compares the common prefix of both vectors; 0 when either side has zero magnitude.
double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

struct ScoreResult {
  bool ok = false;
  double score = 0.0;
  bool exact = false;
};

// Embedding failures disqualify the candidate instead of propagating.
ScoreResult ScoreCandidate(const Params& requested,
                           const Params& candidate,
                           const FuzzyParamsSpec& fuzzy_params,
                           const EmbedFn& embed);

struct MatchResult {
  CacheEntryRef entry;
  CacheHitMeta hit{};
};

// Fresh means now - created_at <= ttl. Ties keep the earliest entry.
std::optional<MatchResult> MatchBest(std::int64_t now_ms,
                                     std::int64_t ttl_ms,
                                     const Params& requested,
                                     const std::vector<CacheEntryRef>& entries,
                                     const FuzzyParamsSpec& fuzzy_params,
                                     const EmbedFn& embed);

}  // namespace fuzzcache
