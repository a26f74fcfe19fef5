#include "fuzzcache/types.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace fuzzcache {
namespace {

bool IsNumericKind(ParamKind kind) {
  return kind == ParamKind::kInteger || kind == ParamKind::kNumber;
}

const ParamField* FindField(const ParamSchema& schema, const std::string& name) {
  for (const auto& field : schema) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

std::optional<std::string> ValidateFieldSpec(const std::string& name,
                                             const FuzzyFieldSpec& spec,
                                             const ParamSchema& schema) {
  const auto* field = FindField(schema, name);
  if (field == nullptr) {
    return "fuzzy spec for field '" + name + "' has no declared kind in CachingConfig.schema";
  }

  return std::visit(
      [&](const auto& s) -> std::optional<std::string> {
        using Spec = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<Spec, ExactUrlSpec>) {
          if (field->kind != ParamKind::kString) {
            return "ExactURL spec on field '" + name + "' requires a string field, got " +
                   std::string(ToString(field->kind));
          }
        } else if constexpr (std::is_same_v<Spec, MoreIsBetterSpec>) {
          if (!IsNumericKind(field->kind)) {
            return "MoreIsBetter spec on field '" + name + "' requires a numeric field, got " +
                   std::string(ToString(field->kind));
          }
        } else {
          if (field->kind != ParamKind::kString) {
            return "CosineSimilarity spec on field '" + name + "' requires a string field, got " +
                   std::string(ToString(field->kind));
          }
          if (!std::isfinite(s.threshold)) {
            return "CosineSimilarity threshold on field '" + name + "' must be finite";
          }
          if (s.model.empty()) {
            return "CosineSimilarity model on field '" + name + "' must be non-empty";
          }
        }
        return std::nullopt;
      },
      spec);
}

}  // namespace

std::optional<double> NumericValue(const ParamValue& value) {
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::nullopt;
}

bool ParamValuesEqual(const ParamValue& lhs, const ParamValue& rhs) {
  if (lhs.index() == rhs.index()) {
    return lhs == rhs;
  }
  const auto* lhs_int = std::get_if<std::int64_t>(&lhs);
  const auto* rhs_int = std::get_if<std::int64_t>(&rhs);
  const auto* lhs_double = std::get_if<double>(&lhs);
  const auto* rhs_double = std::get_if<double>(&rhs);
  if (lhs_int != nullptr && rhs_double != nullptr) {
    return static_cast<double>(*lhs_int) == *rhs_double;
  }
  if (lhs_double != nullptr && rhs_int != nullptr) {
    return *lhs_double == static_cast<double>(*rhs_int);
  }
  return false;
}

Params::Params(std::initializer_list<Field> fields) {
  fields_.reserve(fields.size());
  for (const auto& [name, value] : fields) {
    Set(name, value);
  }
}

Params& Params::Set(std::string name, ParamValue value) {
  for (auto& field : fields_) {
    if (field.first == name) {
      field.second = std::move(value);
      return *this;
    }
  }
  fields_.emplace_back(std::move(name), std::move(value));
  return *this;
}

const ParamValue* Params::Find(std::string_view name) const {
  for (const auto& field : fields_) {
    if (field.first == name) {
      return &field.second;
    }
  }
  return nullptr;
}

bool Params::Contains(std::string_view name) const {
  return Find(name) != nullptr;
}

std::string_view ToString(CacheHitKind kind) {
  switch (kind) {
    case CacheHitKind::kMiss:
      return "miss";
    case CacheHitKind::kExact:
      return "exact";
    case CacheHitKind::kFuzzy:
      return "fuzzy";
  }
  return "unknown";
}

std::string_view ToString(ParamKind kind) {
  switch (kind) {
    case ParamKind::kBool:
      return "bool";
    case ParamKind::kInteger:
      return "integer";
    case ParamKind::kNumber:
      return "number";
    case ParamKind::kString:
      return "string";
    case ParamKind::kStringList:
      return "string_list";
  }
  return "unknown";
}

bool ValueMatchesKind(const ParamValue& value, ParamKind kind) {
  switch (kind) {
    case ParamKind::kBool:
      return std::holds_alternative<bool>(value);
    case ParamKind::kInteger:
      return std::holds_alternative<std::int64_t>(value);
    case ParamKind::kNumber:
      return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
    case ParamKind::kString:
      return std::holds_alternative<std::string>(value);
    case ParamKind::kStringList:
      return std::holds_alternative<std::vector<std::string>>(value);
  }
  return false;
}

std::optional<std::string> ValidateCachingConfig(const CachingConfig& config) {
  if (config.cache_name.empty()) {
    return "CachingConfig.cache_name must be non-empty";
  }
  if (config.ttl_millis.has_value() && *config.ttl_millis <= 0) {
    return "CachingConfig.ttl_millis must be positive, got " + std::to_string(*config.ttl_millis);
  }

  std::unordered_set<std::string> declared{};
  for (const auto& field : config.schema) {
    if (field.name.empty()) {
      return "CachingConfig.schema field names must be non-empty";
    }
    if (!declared.insert(field.name).second) {
      return "CachingConfig.schema declares field '" + field.name + "' twice";
    }
  }

  for (const auto& [name, spec] : config.fuzzy_params) {
    if (auto error = ValidateFieldSpec(name, spec, config.schema); error.has_value()) {
      return error;
    }
  }
  return std::nullopt;
}

void ValidateParams(const ParamSchema& schema, const Params& params) {
  for (const auto& field : schema) {
    const auto* value = params.Find(field.name);
    if (value == nullptr) {
      continue;
    }
    if (!ValueMatchesKind(*value, field.kind)) {
      throw std::invalid_argument("ValidateParams field '" + field.name + "' must hold a " +
                                  std::string(ToString(field.kind)) + " value");
    }
  }
}

}  // namespace fuzzcache
