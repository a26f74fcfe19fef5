#include "fuzzcache/fuzzy_cache.hpp"
#include "fuzzcache/logging.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fuzzcache {

std::int64_t SystemClockMillis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

namespace detail {

CacheEngine::CacheEngine(std::shared_ptr<EntryStore> store, std::shared_ptr<Embeddings> embeddings, Clock clock)
    : store_(std::move(store)), embeddings_(std::move(embeddings)), clock_(std::move(clock)) {
  if (store_ == nullptr) {
    throw std::invalid_argument("FuzzyCache requires an entry store");
  }
  if (embeddings_ == nullptr) {
    throw std::invalid_argument("FuzzyCache requires an embeddings memoizer");
  }
  if (!clock_) {
    throw std::invalid_argument("FuzzyCache requires a clock");
  }
}

Lookup CacheEngine::Find(const CachingConfig& config, const Params& params, const std::type_info& outcome_type) const {
  ValidateParams(config.schema, params);

  Lookup lookup{};
  lookup.now_ms = clock_();
  const auto ttl_ms = config.ttl_millis.value_or(kDefaultTtlMillis);

  auto entries = store_->GetAll(config.cache_name);
  std::vector<CacheEntryRef> replayable{};
  replayable.reserve(entries.size());
  for (auto& entry : entries) {
    if (entry == nullptr) {
      continue;
    }
    if (entry->outcome.type() != outcome_type) {
      Logger()->debug("cache '{}': skipping entry holding a different result type", config.cache_name);
      continue;
    }
    replayable.push_back(std::move(entry));
  }

  const auto embeddings = embeddings_;
  const EmbedFn embed = [embeddings](const std::string& text, const std::string& model) {
    return embeddings->Embed(text, model);
  };
  lookup.match = MatchBest(lookup.now_ms, ttl_ms, params, replayable, config.fuzzy_params, embed);

  if (lookup.match.has_value()) {
    Logger()->debug("cache '{}': {} hit, score {:.4f} among {} entries", config.cache_name,
                    ToString(lookup.match->hit.kind), lookup.match->hit.score, replayable.size());
  } else {
    Logger()->debug("cache '{}': miss among {} entries", config.cache_name, replayable.size());
  }
  return lookup;
}

void CacheEngine::Record(const CachingConfig& config, const Params& params, std::any outcome, std::int64_t now_ms) const {
  CacheEntry entry{};
  entry.params = params;
  entry.outcome = std::move(outcome);
  entry.created_at_ms = now_ms;
  store_->Put(config.cache_name, std::move(entry));
}

std::optional<std::string> CheckWrapConfig(const CachingConfig& config) {
  auto error = ValidateCachingConfig(config);
  if (error.has_value()) {
    Logger()->error("invalid caching config for '{}': {}", config.cache_name, *error);
  }
  return error;
}

}  // namespace detail

FuzzyCache::FuzzyCache(std::shared_ptr<EntryStore> store, std::shared_ptr<Embeddings> embeddings, Clock clock)
    : engine_(std::make_shared<const detail::CacheEngine>(std::move(store), std::move(embeddings), std::move(clock))) {}

}  // namespace fuzzcache
