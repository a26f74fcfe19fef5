#pragma once

#include "fuzzcache/types.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fuzzcache {

struct CacheEntry {
  Params params;
  std::any outcome;
  std::int64_t created_at_ms = 0;
};

using CacheEntryRef = std::shared_ptr<const CacheEntry>;

class EntryStore {
 public:
  virtual ~EntryStore() = default;

  virtual std::vector<CacheEntryRef> GetAll(const std::string& cache_name) const = 0;
  virtual void Put(const std::string& cache_name, CacheEntry entry) = 0;
  virtual std::size_t Size(const std::string& cache_name) const = 0;
};

// Append-only; GetAll returns a snapshot in insertion order.
class InMemoryEntryStore final : public EntryStore {
 public:
  InMemoryEntryStore() = default;

  std::vector<CacheEntryRef> GetAll(const std::string& cache_name) const override;
  void Put(const std::string& cache_name, CacheEntry entry) override;
  std::size_t Size(const std::string& cache_name) const override;

 private:
  std::unordered_map<std::string, std::vector<CacheEntryRef>> entries_;
  mutable std::mutex mutex_{};
};

}  // namespace fuzzcache
