/*
 * Copyright 2022 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <tyfmt/doc.h>
#include <tyfmt/optional.h>

#include <memory>
#include <vector>

#include "unit.h"

TEST(option_none_is_none) {
  tyfmt::optional<int> none;
  EXPECT_FALSE((bool)none);
  EXPECT_EQUAL(7, none.value_or(7));
}

TEST(option_some) {
  auto width = tyfmt::some(10);
  ASSERT_TRUE((bool)width);
  EXPECT_EQUAL(10, *width);
  EXPECT_EQUAL(10, width.value_or(7));
}

TEST(option_make_some) {
  auto text = tyfmt::make_some<std::string>(3, 'x');
  ASSERT_TRUE((bool)text);
  EXPECT_EQUAL("xxx", *text);
  EXPECT_EQUAL(3u, text->size());
}

TEST(option_move_empties_source) {
  tyfmt::optional<tyfmt::doc> first = tyfmt::some(tyfmt::doc::lit("Vec<T>"));
  tyfmt::optional<tyfmt::doc> second(std::move(first));
  EXPECT_FALSE((bool)first);
  ASSERT_TRUE((bool)second);
  EXPECT_EQUAL("Vec<T>", second->as_string());

  tyfmt::optional<std::unique_ptr<int>> move_only1 = tyfmt::some(std::make_unique<int>(10));
  tyfmt::optional<std::unique_ptr<int>> move_only2;
  move_only2 = std::move(move_only1);
  EXPECT_FALSE((bool)move_only1);
  ASSERT_TRUE((bool)move_only2);
  EXPECT_EQUAL(10, **move_only2);
}

TEST(option_copy) {
  tyfmt::optional<tyfmt::doc> none1;
  tyfmt::optional<tyfmt::doc> none2(none1);
  EXPECT_FALSE((bool)none2);

  tyfmt::optional<tyfmt::doc> some1 = tyfmt::some(tyfmt::doc::lit("u8"));
  tyfmt::optional<tyfmt::doc> some2;
  some2 = some1;
  ASSERT_TRUE((bool)some1);
  ASSERT_TRUE((bool)some2);
  EXPECT_EQUAL(some1->as_string(), some2->as_string());
}

class DestructCount {
 private:
  int* count = nullptr;

 public:
  DestructCount(int& count) : count(&count) { ++*this->count; }
  DestructCount(const DestructCount& other) : count(other.count) { ++*count; }
  DestructCount(DestructCount&& other) : count(other.count) { other.count = nullptr; }
  ~DestructCount() {
    if (count) --*count;
  }
};

TEST(option_destructs) {
  int counter = 0;
  {
    tyfmt::optional<DestructCount> a(tyfmt::in_place_t{}, counter);
    EXPECT_EQUAL(1, counter);
    tyfmt::optional<DestructCount> b;
    b = a;
    EXPECT_EQUAL(2, counter);
    a = tyfmt::optional<DestructCount>();
    EXPECT_EQUAL(1, counter);
  }
  ASSERT_EQUAL(0, counter);

  {
    std::vector<tyfmt::optional<DestructCount>> counters;
    for (int i = 0; i < 100; ++i) counters.emplace_back(tyfmt::in_place_t{}, counter);
    EXPECT_EQUAL(100, counter);
  }
  ASSERT_EQUAL(0, counter);
}

TEST(option_checked_sub) {
  auto fits = tyfmt::checked_sub(10, 4);
  ASSERT_TRUE((bool)fits);
  EXPECT_EQUAL(6u, *fits);

  auto exact = tyfmt::checked_sub(4, 4);
  ASSERT_TRUE((bool)exact);
  EXPECT_EQUAL(0u, *exact);

  EXPECT_FALSE((bool)tyfmt::checked_sub(3, 4));
  EXPECT_FALSE((bool)tyfmt::checked_sub(0, 1));
}
