#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace fuzzcache {

using ParamValue = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::string>>;

// Integer and double alternatives compare by numeric value.
bool ParamValuesEqual(const ParamValue& lhs, const ParamValue& rhs);
std::optional<double> NumericValue(const ParamValue& value);

class Params {
 public:
  using Field = std::pair<std::string, ParamValue>;
  using const_iterator = std::vector<Field>::const_iterator;

  Params() = default;
  Params(std::initializer_list<Field> fields);

  Params& Set(std::string name, ParamValue value);
  [[nodiscard]] const ParamValue* Find(std::string_view name) const;
  [[nodiscard]] bool Contains(std::string_view name) const;

  [[nodiscard]] std::size_t size() const { return fields_.size(); }
  [[nodiscard]] bool empty() const { return fields_.empty(); }
  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }

 private:
  std::vector<Field> fields_;
};

enum class ParamKind {
  kBool,
  kInteger,
  kNumber,
  kString,
  kStringList,
};

struct ParamField {
  std::string name;
  ParamKind kind = ParamKind::kString;
};

using ParamSchema = std::vector<ParamField>;

struct ExactUrlSpec {
  bool exclude_hash = false;
};

struct MoreIsBetterSpec {};

struct CosineSimilaritySpec {
  double threshold = 0.0;
  std::string model;
};

using FuzzyFieldSpec = std::variant<ExactUrlSpec, MoreIsBetterSpec, CosineSimilaritySpec>;
using FuzzyParamsSpec = std::unordered_map<std::string, FuzzyFieldSpec>;

enum class CacheHitKind {
  kMiss,
  kExact,
  kFuzzy,
};

// score is only comparable between candidates of the same lookup.
struct CacheHitMeta {
  CacheHitKind kind = CacheHitKind::kMiss;
  double score = 0.0;
};

inline constexpr std::int64_t kDefaultTtlMillis = 24LL * 60LL * 60LL * 1000LL;

struct CachingConfig {
  std::string cache_name;
  FuzzyParamsSpec fuzzy_params{};
  ParamSchema schema{};
  std::optional<std::int64_t> ttl_millis{};
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

std::string_view ToString(CacheHitKind kind);
std::string_view ToString(ParamKind kind);
bool ValueMatchesKind(const ParamValue& value, ParamKind kind);

// Returns the first violation, or nullopt for a usable configuration.
std::optional<std::string> ValidateCachingConfig(const CachingConfig& config);

// Throws std::invalid_argument when a declared field holds a value of another kind.
void ValidateParams(const ParamSchema& schema, const Params& params);

}  // namespace fuzzcache
