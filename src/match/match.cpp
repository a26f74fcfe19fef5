#include "fuzzcache/match.hpp"
#include "fuzzcache/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fuzzcache {
namespace {

constexpr ScoreResult kDisqualified{false, 0.0, false};

// Contribution of one field: nullopt disqualifies the candidate.
struct FieldMatch {
  double score = 0.0;
  bool exact = true;
};

std::optional<FieldMatch> MatchExactValue(const ParamValue& requested, const ParamValue& candidate) {
  if (!ParamValuesEqual(requested, candidate)) {
    return std::nullopt;
  }
  return FieldMatch{1.0, true};
}

std::optional<FieldMatch> MatchUrl(const ParamValue& requested, const ParamValue& candidate, const ExactUrlSpec& spec) {
  const auto* requested_url = std::get_if<std::string>(&requested);
  const auto* candidate_url = std::get_if<std::string>(&candidate);
  if (requested_url == nullptr || candidate_url == nullptr) {
    return std::nullopt;
  }
  if (NormalizeUrl(*requested_url, spec) != NormalizeUrl(*candidate_url, spec)) {
    return std::nullopt;
  }
  return FieldMatch{1.0, true};
}

std::optional<FieldMatch> MatchMoreIsBetter(const ParamValue& requested, const ParamValue& candidate) {
  const auto* requested_int = std::get_if<std::int64_t>(&requested);
  const auto* candidate_int = std::get_if<std::int64_t>(&candidate);
  if (requested_int != nullptr && candidate_int != nullptr) {
    if (*candidate_int < *requested_int) {
      return std::nullopt;
    }
    return FieldMatch{1.0, *candidate_int == *requested_int};
  }

  const auto requested_number = NumericValue(requested);
  const auto candidate_number = NumericValue(candidate);
  if (!requested_number.has_value() || !candidate_number.has_value() || std::isnan(*requested_number) ||
      std::isnan(*candidate_number)) {
    return std::nullopt;
  }
  if (*candidate_number < *requested_number) {
    return std::nullopt;
  }
  return FieldMatch{1.0, *candidate_number == *requested_number};
}

std::optional<FieldMatch> MatchCosine(const std::string& field,
                                      const ParamValue& requested,
                                      const ParamValue& candidate,
                                      const CosineSimilaritySpec& spec,
                                      const EmbedFn& embed) {
  const auto* requested_text = std::get_if<std::string>(&requested);
  const auto* candidate_text = std::get_if<std::string>(&candidate);
  if (requested_text == nullptr || candidate_text == nullptr) {
    return std::nullopt;
  }

  std::vector<float> requested_vector{};
  std::vector<float> candidate_vector{};
  try {
    requested_vector = embed(*requested_text, spec.model);
    candidate_vector = embed(*candidate_text, spec.model);
  } catch (const std::exception& ex) {
    Logger()->debug("embedding failed for field '{}' (model '{}'); candidate skipped: {}", field, spec.model,
                    ex.what());
    return std::nullopt;
  } catch (...) {
    Logger()->debug("embedding failed for field '{}' (model '{}') with a non-standard exception; candidate skipped",
                    field, spec.model);
    return std::nullopt;
  }

  const double similarity = CosineSimilarity(requested_vector, candidate_vector);
  if (similarity < spec.threshold) {
    return std::nullopt;
  }
  return FieldMatch{similarity, similarity >= 1.0};
}

}  // namespace

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  const auto len = std::min(a.size(), b.size());
  double dot = 0.0;
  double mag_a = 0.0;
  double mag_b = 0.0;
  for (std::size_t i = 0; i < len; ++i) {
    const auto ai = static_cast<double>(a[i]);
    const auto bi = static_cast<double>(b[i]);
    dot += ai * bi;
    mag_a += ai * ai;
    mag_b += bi * bi;
  }
  if (mag_a == 0.0 || mag_b == 0.0) {
    return 0.0;
  }
  // Exactly 1 for identical vectors, unlike sqrt(a) * sqrt(b).
  const double similarity = dot / std::sqrt(mag_a * mag_b);
  return std::max(-1.0, std::min(1.0, similarity));
}

ScoreResult ScoreCandidate(const Params& requested,
                           const Params& candidate,
                           const FuzzyParamsSpec& fuzzy_params,
                           const EmbedFn& embed) {
  double score = 0.0;
  bool exact = true;

  for (const auto& requested_field : requested) {
    const auto& field = requested_field.first;
    const auto& requested_value = requested_field.second;
    const auto* candidate_value = candidate.Find(field);
    if (candidate_value == nullptr) {
      return kDisqualified;
    }

    std::optional<FieldMatch> match{};
    const auto spec = fuzzy_params.find(field);
    if (spec == fuzzy_params.end()) {
      match = MatchExactValue(requested_value, *candidate_value);
    } else {
      match = std::visit(
          [&](const auto& s) -> std::optional<FieldMatch> {
            using Spec = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<Spec, ExactUrlSpec>) {
              return MatchUrl(requested_value, *candidate_value, s);
            } else if constexpr (std::is_same_v<Spec, MoreIsBetterSpec>) {
              return MatchMoreIsBetter(requested_value, *candidate_value);
            } else {
              return MatchCosine(field, requested_value, *candidate_value, s, embed);
            }
          },
          spec->second);
    }

    if (!match.has_value()) {
      return kDisqualified;
    }
    score += match->score;
    exact = exact && match->exact;
  }

  return ScoreResult{true, score, exact};
}

std::optional<MatchResult> MatchBest(std::int64_t now_ms,
                                     std::int64_t ttl_ms,
                                     const Params& requested,
                                     const std::vector<CacheEntryRef>& entries,
                                     const FuzzyParamsSpec& fuzzy_params,
                                     const EmbedFn& embed) {
  std::optional<MatchResult> best{};
  for (const auto& entry : entries) {
    if (entry == nullptr || now_ms - entry->created_at_ms > ttl_ms) {
      continue;
    }
    const auto scored = ScoreCandidate(requested, entry->params, fuzzy_params, embed);
    if (!scored.ok) {
      continue;
    }
    if (!best.has_value() || scored.score > best->hit.score) {
      best = MatchResult{
          entry,
          CacheHitMeta{scored.exact ? CacheHitKind::kExact : CacheHitKind::kFuzzy, scored.score},
      };
    }
  }
  return best;
}

}  // namespace fuzzcache
