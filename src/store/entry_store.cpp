#include "fuzzcache/entry_store.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace fuzzcache {

std::vector<CacheEntryRef> InMemoryEntryStore::GetAll(const std::string& cache_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(cache_name);
  if (it == entries_.end()) {
    return {};
  }
  return it->second;
}

void InMemoryEntryStore::Put(const std::string& cache_name, CacheEntry entry) {
  if (cache_name.empty()) {
    throw std::invalid_argument("InMemoryEntryStore::Put cache_name must be non-empty");
  }
  auto stored = std::make_shared<const CacheEntry>(std::move(entry));

  std::lock_guard<std::mutex> lock(mutex_);
  entries_[cache_name].push_back(std::move(stored));
}

std::size_t InMemoryEntryStore::Size(const std::string& cache_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(cache_name);
  return it == entries_.end() ? 0 : it->second.size();
}

}  // namespace fuzzcache
