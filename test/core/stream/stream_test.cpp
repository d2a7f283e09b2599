/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream.hpp"

#include <gtest/gtest.h>
#include <string>
#include <system_error>

#include "testutil/outcome.hpp"

using namespace ratemon::stream;

namespace {
  /// Stream yielding `good` elements and then failing
  Stream<int> failingAfter(int good) {
    auto pulled = std::make_shared<int>(0);
    return Stream<int>{[pulled, good]() -> outcome::result<std::optional<int>> {
      if (*pulled == good) {
        return std::make_error_code(std::errc::io_error);
      }
      return std::optional<int>{(*pulled)++};
    }};
  }
}  // namespace

/**
 * @given a stream of a vector
 * @when pulling past its end
 * @then the elements come in order and the stream stays over
 */
TEST(StreamTest, FromVector) {
  auto stream = fromVector<int>({1, 2});
  EXPECT_OUTCOME_TRUE(first, stream.next());
  EXPECT_EQ(first, 1);
  EXPECT_OUTCOME_TRUE(second, stream.next());
  EXPECT_EQ(second, 2);
  EXPECT_OUTCOME_TRUE(end, stream.next());
  EXPECT_FALSE(end.has_value());
  EXPECT_OUTCOME_TRUE(still_end, stream.next());
  EXPECT_FALSE(still_end.has_value());
}

/**
 * @given an infinite stream of naturals
 * @when taking five of them
 * @then the first five naturals are collected
 */
TEST(StreamTest, IterateAndTake) {
  auto naturals = iterate(0, [](int n) { return n + 1; });
  EXPECT_OUTCOME_TRUE(items, toVector(take(naturals, 5)));
  EXPECT_EQ(items, (std::vector<int>{0, 1, 2, 3, 4}));
}

/**
 * @given two finite streams
 * @when concatenating and mapping them
 * @then the mapped elements of both come in order
 */
TEST(StreamTest, ConcatAndMap) {
  auto joined = concat(fromVector<int>({1, 2}), once(3));
  auto mapped = map(joined, [](int n) { return std::to_string(n * 10); });
  EXPECT_OUTCOME_TRUE(items, toVector(mapped));
  EXPECT_EQ(items, (std::vector<std::string>{"10", "20", "30"}));
}

/**
 * @given a stream failing after two elements
 * @when taking elements while they are small
 * @then the stream ends before the failing pull
 */
TEST(StreamTest, TakeWhileStopsPulling) {
  auto small = takeWhile(failingAfter(2), [](int n) { return n < 1; });
  EXPECT_OUTCOME_TRUE(items, toVector(small));
  EXPECT_EQ(items, (std::vector<int>{0}));
}

/**
 * @given a stream of optional values
 * @when catting the optionals
 * @then only present values remain
 */
TEST(StreamTest, CatOptionals) {
  auto values = catOptionals(fromVector<std::optional<int>>(
      {std::nullopt, 1, std::nullopt, std::nullopt, 2}));
  EXPECT_OUTCOME_TRUE(items, toVector(values));
  EXPECT_EQ(items, (std::vector<int>{1, 2}));
}

/**
 * @given a stream failing after two elements
 * @when draining it
 * @then the failure is returned
 */
TEST(StreamTest, ErrorPropagates) {
  EXPECT_EC(drain(map(failingAfter(2), [](int n) { return n; })),
            std::make_error_code(std::errc::io_error));
}

/**
 * @given a finite stream
 * @when draining it
 * @then the number of elements is returned
 */
TEST(StreamTest, Drain) {
  EXPECT_OUTCOME_TRUE(count, drain(fromVector<int>({5, 6, 7})));
  EXPECT_EQ(count, 3u);
}
