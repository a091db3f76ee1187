#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "docqa_core/services/answer_composer.hpp"
#include "docqa_core/services/embedding_service.hpp"

namespace docqa_core {

struct RetryPolicy {
  int max_attempts = 1;
  int backoff_ms = 500;
};

// Runs fn, retrying provider failures with doubling backoff until max_attempts is used
// up. The last provider error is rethrown; other exceptions pass straight through.
template <typename Fn>
auto with_retry(const RetryPolicy &policy, const std::string &operation, Fn &&fn) -> decltype(fn()) {
  const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  auto delay = std::chrono::milliseconds(policy.backoff_ms < 0 ? 0 : policy.backoff_ms);

  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const EmbeddingProviderError &e) {
      if (attempt >= attempts) {
        throw;
      }
      std::cerr << operation << " failed (attempt " << attempt << "/" << attempts
                << "): " << e.what() << ". Retrying in " << delay.count() << "ms" << std::endl;
    } catch (const CompletionProviderError &e) {
      if (attempt >= attempts) {
        throw;
      }
      std::cerr << operation << " failed (attempt " << attempt << "/" << attempts
                << "): " << e.what() << ". Retrying in " << delay.count() << "ms" << std::endl;
    }
    std::this_thread::sleep_for(delay);
    delay *= 2;
  }
}

}  // namespace docqa_core
