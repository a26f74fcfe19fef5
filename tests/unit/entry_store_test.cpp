#include "fuzzcache/entry_store.hpp"
#include "fuzzcache/outcome.hpp"

#include "../test_logger.hpp"

#include <any>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

fuzzcache::CacheEntry MakeEntry(std::int64_t id, std::int64_t created_at_ms) {
  fuzzcache::CacheEntry entry{};
  entry.params = {{"id", id}};
  entry.outcome = fuzzcache::Outcome<std::int64_t>::Success(id * 10);
  entry.created_at_ms = created_at_ms;
  return entry;
}

std::int64_t IdOf(const fuzzcache::CacheEntryRef& entry) {
  return std::get<std::int64_t>(*entry->params.Find("id"));
}

void ScenarioStoreAndRetrieve() {
  fuzzcache::tests::Log("scenario: store and retrieve");
  fuzzcache::InMemoryEntryStore store;
  store.Put("cache", MakeEntry(1, 100));

  const auto entries = store.GetAll("cache");
  Require(entries.size() == 1, "stored entry must be returned");
  Require(IdOf(entries[0]) == 1, "params must round-trip");
  Require(entries[0]->created_at_ms == 100, "created_at must round-trip");
  const auto& outcome = std::any_cast<const fuzzcache::Outcome<std::int64_t>&>(entries[0]->outcome);
  Require(outcome.ok() && outcome.value() == 10, "outcome must round-trip");
}

void ScenarioUnknownNameIsEmpty() {
  fuzzcache::tests::Log("scenario: unknown name is empty");
  fuzzcache::InMemoryEntryStore store;
  Require(store.GetAll("nothing-here").empty(), "unknown cache must be empty");
  Require(store.Size("nothing-here") == 0, "unknown cache size must be zero");
}

void ScenarioIsolationAndOrder() {
  fuzzcache::tests::Log("scenario: isolation and order");
  fuzzcache::InMemoryEntryStore store;
  store.Put("a", MakeEntry(1, 1));
  store.Put("b", MakeEntry(2, 1));
  store.Put("a", MakeEntry(3, 1));
  store.Put("a", MakeEntry(1, 2));

  const auto a = store.GetAll("a");
  Require(a.size() == 3 && store.Size("a") == 3, "cache a must hold its own three entries");
  Require(IdOf(a[0]) == 1 && IdOf(a[1]) == 3 && IdOf(a[2]) == 1, "entries must keep insertion order");
  Require(a[0]->created_at_ms != a[2]->created_at_ms, "duplicate params must be kept as separate entries");
  Require(store.GetAll("b").size() == 1, "cache b must hold one entry");
}

void ScenarioSnapshotIsStable() {
  fuzzcache::tests::Log("scenario: snapshot is stable");
  fuzzcache::InMemoryEntryStore store;
  store.Put("cache", MakeEntry(1, 1));
  const auto snapshot = store.GetAll("cache");
  store.Put("cache", MakeEntry(2, 2));
  Require(snapshot.size() == 1, "later appends must not appear in an earlier snapshot");
  Require(store.GetAll("cache").size() == 2, "new snapshot must see the append");
}

void ScenarioFailureOutcome() {
  fuzzcache::tests::Log("scenario: failure outcome");
  fuzzcache::InMemoryEntryStore store;
  fuzzcache::CacheEntry entry{};
  entry.params = {{"id", 9}};
  entry.outcome = fuzzcache::Outcome<std::int64_t>::Failure(std::make_exception_ptr(std::out_of_range("boom")));
  store.Put("cache", std::move(entry));

  const auto& outcome = std::any_cast<const fuzzcache::Outcome<std::int64_t>&>(store.GetAll("cache")[0]->outcome);
  Require(!outcome.ok(), "failure must stay a failure");
  bool rethrown = false;
  try {
    (void)outcome.Replay();
  } catch (const std::out_of_range& ex) {
    rethrown = std::string(ex.what()) == "boom";
  }
  Require(rethrown, "stored failure must replay the original exception");
}

void ScenarioConcurrentPuts() {
  fuzzcache::tests::Log("scenario: concurrent puts");
  fuzzcache::InMemoryEntryStore store;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;

  std::vector<std::thread> threads{};
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        store.Put("shared", MakeEntry(static_cast<std::int64_t>(t) * kPerThread + i, 0));
        if (i % 50 == 0) {
          (void)store.GetAll("shared");
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto entries = store.GetAll("shared");
  Require(entries.size() == static_cast<std::size_t>(kThreads * kPerThread), "no concurrent put may be lost");
  std::unordered_set<std::int64_t> ids{};
  for (const auto& entry : entries) {
    ids.insert(IdOf(entry));
  }
  Require(ids.size() == entries.size(), "every put must be stored exactly once");
  fuzzcache::tests::LogKV("stored_entries", static_cast<std::uint64_t>(entries.size()));
}

void ScenarioRejectsEmptyName() {
  fuzzcache::tests::Log("scenario: rejects empty name");
  fuzzcache::InMemoryEntryStore store;
  bool threw = false;
  try {
    store.Put("", MakeEntry(1, 1));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "empty cache name must be rejected");
}

}  // namespace

int main() {
  try {
    fuzzcache::tests::Log("entry_store_test: start");
    ScenarioStoreAndRetrieve();
    ScenarioUnknownNameIsEmpty();
    ScenarioIsolationAndOrder();
    ScenarioSnapshotIsStable();
    ScenarioFailureOutcome();
    ScenarioConcurrentPuts();
    ScenarioRejectsEmptyName();
    fuzzcache::tests::Log("entry_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    fuzzcache::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
