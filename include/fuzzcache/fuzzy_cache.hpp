#pragma once

#include "fuzzcache/embeddings.hpp"
#include "fuzzcache/entry_store.hpp"
#include "fuzzcache/match.hpp"
#include "fuzzcache/outcome.hpp"
#include "fuzzcache/types.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace fuzzcache {

// Epoch milliseconds.
using Clock = std::function<std::int64_t()>;

std::int64_t SystemClockMillis();

template <typename T>
struct Cached {
  T value;
  CacheHitMeta cache{};
};

template <typename T>
struct CachedOutcome {
  Outcome<T> outcome;
  CacheHitMeta cache{};
};

namespace detail {

struct Lookup {
  std::int64_t now_ms = 0;
  std::optional<MatchResult> match;
};

class CacheEngine {
 public:
  CacheEngine(std::shared_ptr<EntryStore> store, std::shared_ptr<Embeddings> embeddings, Clock clock);

  Lookup Find(const CachingConfig& config, const Params& params, const std::type_info& outcome_type) const;
  void Record(const CachingConfig& config, const Params& params, std::any outcome, std::int64_t now_ms) const;

 private:
  std::shared_ptr<EntryStore> store_;
  std::shared_ptr<Embeddings> embeddings_;
  Clock clock_;
};

// Validates and logs a rejected configuration.
std::optional<std::string> CheckWrapConfig(const CachingConfig& config);

}  // namespace detail

// An invalid CachingConfig yields a wrapper that throws ConfigError on every call.
class FuzzyCache {
 public:
  FuzzyCache(std::shared_ptr<EntryStore> store,
             std::shared_ptr<Embeddings> embeddings,
             Clock clock = SystemClockMillis);

  // Failures of fn are returned in the outcome, not thrown.
  template <typename Fn, typename T = std::decay_t<std::invoke_result_t<Fn&, const Params&>>>
  std::function<CachedOutcome<T>(const Params&)> WithCachingOutcome(Fn fn, CachingConfig config) const;

  // Failures of fn are rethrown, fresh or replayed.
  template <typename Fn, typename T = std::decay_t<std::invoke_result_t<Fn&, const Params&>>>
  std::function<T(const Params&)> WithCaching(Fn fn, CachingConfig config) const;

  // Like WithCaching; a rethrown failure carries no metadata.
  template <typename Fn, typename T = std::decay_t<std::invoke_result_t<Fn&, const Params&>>>
  std::function<Cached<T>(const Params&)> WithCachingMeta(Fn fn, CachingConfig config) const;

 private:
  std::shared_ptr<const detail::CacheEngine> engine_;
};

template <typename Fn, typename T>
std::function<CachedOutcome<T>(const Params&)> FuzzyCache::WithCachingOutcome(Fn fn, CachingConfig config) const {
  static_assert(std::is_copy_constructible_v<T>, "cached result type must be copy constructible");

  if (const auto error = detail::CheckWrapConfig(config); error.has_value()) {
    return [message = *error](const Params&) -> CachedOutcome<T> { throw ConfigError(message); };
  }

  return [engine = engine_, fn = std::move(fn), config = std::move(config)](
             const Params& params) mutable -> CachedOutcome<T> {
    auto lookup = engine->Find(config, params, typeid(Outcome<T>));
    if (lookup.match.has_value()) {
      const auto& stored = std::any_cast<const Outcome<T>&>(lookup.match->entry->outcome);
      return CachedOutcome<T>{stored, lookup.match->hit};
    }

    auto outcome = Outcome<T>::Capture(fn, params);
    engine->Record(config, params, std::any(outcome), lookup.now_ms);
    return CachedOutcome<T>{std::move(outcome), CacheHitMeta{}};
  };
}

template <typename Fn, typename T>
std::function<T(const Params&)> FuzzyCache::WithCaching(Fn fn, CachingConfig config) const {
  auto cached = WithCachingOutcome<Fn, T>(std::move(fn), std::move(config));
  return [cached = std::move(cached)](const Params& params) -> T { return cached(params).outcome.Replay(); };
}

template <typename Fn, typename T>
std::function<Cached<T>(const Params&)> FuzzyCache::WithCachingMeta(Fn fn, CachingConfig config) const {
  auto cached = WithCachingOutcome<Fn, T>(std::move(fn), std::move(config));
  return [cached = std::move(cached)](const Params& params) -> Cached<T> {
    auto result = cached(params);
    return Cached<T>{result.outcome.Replay(), result.cache};
  };
}

}  // namespace fuzzcache
