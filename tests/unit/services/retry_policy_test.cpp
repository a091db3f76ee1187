#include <gtest/gtest.h>

#include <stdexcept>

#include "docqa_core/services/retry_policy.hpp"

namespace docqa_core {

TEST(RetryPolicyTest, ReturnsFirstSuccess) {
  int calls = 0;
  int result = with_retry(RetryPolicy{.max_attempts = 3, .backoff_ms = 0}, "op", [&] {
    ++calls;
    return 42;
  });

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, RetriesProviderErrorsUntilSuccess) {
  int calls = 0;
  int result = with_retry(RetryPolicy{.max_attempts = 3, .backoff_ms = 0}, "op", [&] {
    if (++calls < 3) {
      throw EmbeddingProviderError("flaky");
    }
    return 7;
  });

  EXPECT_EQ(result, 7);
  EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, RethrowsAfterLastAttempt) {
  int calls = 0;
  auto always_fail = [&]() -> int {
    ++calls;
    throw CompletionProviderError("down");
  };

  EXPECT_THROW(with_retry(RetryPolicy{.max_attempts = 2, .backoff_ms = 0}, "op", always_fail),
               CompletionProviderError);
  EXPECT_EQ(calls, 2);
}

TEST(RetryPolicyTest, OtherErrorsAreNotRetried) {
  int calls = 0;
  auto broken = [&]() -> int {
    ++calls;
    throw std::logic_error("bug");
  };

  EXPECT_THROW(with_retry(RetryPolicy{.max_attempts = 5, .backoff_ms = 0}, "op", broken),
               std::logic_error);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, NonPositiveAttemptsMeanOneTry) {
  int calls = 0;
  auto always_fail = [&]() -> int {
    ++calls;
    throw EmbeddingProviderError("down");
  };

  EXPECT_THROW(with_retry(RetryPolicy{.max_attempts = 0, .backoff_ms = 0}, "op", always_fail),
               EmbeddingProviderError);
  EXPECT_EQ(calls, 1);
}

}  // namespace docqa_core
