#include "fuzzcache/outcome.hpp"
#include "fuzzcache/types.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>

int main() {
  fuzzcache::tests::Log("smoke_test: start");
  fuzzcache::CachingConfig config;
  config.cache_name = "smoke";
  if (config.ttl_millis.has_value()) {
    std::cerr << "ttl_millis must default to unset\n";
    return EXIT_FAILURE;
  }
  if (fuzzcache::kDefaultTtlMillis != 86'400'000) {
    std::cerr << "default ttl must be 24 hours\n";
    return EXIT_FAILURE;
  }
  if (fuzzcache::ValidateCachingConfig(config).has_value()) {
    std::cerr << "minimal config must validate\n";
    return EXIT_FAILURE;
  }
  fuzzcache::CacheHitMeta meta;
  if (meta.kind != fuzzcache::CacheHitKind::kMiss || meta.score != 0.0) {
    std::cerr << "hit metadata must default to a zero-score miss\n";
    return EXIT_FAILURE;
  }

  bool rejected = false;
  try {
    (void)fuzzcache::Outcome<int>::Failure(std::exception_ptr{});
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  if (!rejected) {
    std::cerr << "an outcome failure must hold an exception\n";
    return EXIT_FAILURE;
  }

  fuzzcache::tests::Log("smoke_test: finished");
  std::cout << "fuzzcache smoke test passed\n";
  return EXIT_SUCCESS;
}
