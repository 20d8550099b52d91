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

#include <tyfmt/result.h>

#include <memory>
#include <string>

#include "unit.h"

TEST(result_err_is_err) {
  tyfmt::result<int, std::string> err = tyfmt::result_error<int>(std::string("bad width"));
  EXPECT_FALSE((bool)err);
  EXPECT_EQUAL("bad width", err.error());
}

TEST(result_value) {
  tyfmt::result<int, std::string> value = tyfmt::result_value<std::string>(10);
  ASSERT_TRUE((bool)value);
  EXPECT_EQUAL(10, *value);
}

TEST(result_inplace) {
  auto pair = tyfmt::make_result<std::pair<int, int>, int>(4, 80);
  ASSERT_TRUE((bool)pair);
  EXPECT_EQUAL(std::make_pair(4, 80), *pair);

  auto err = tyfmt::make_error<int, std::string>(3, 'x');
  ASSERT_FALSE((bool)err);
  EXPECT_EQUAL("xxx", err.error());
}

TEST(result_copy_and_assign) {
  tyfmt::result<int, int> err1 = tyfmt::result_error<int>(10);
  tyfmt::result<int, int> value1 = tyfmt::result_value<int>(20);

  tyfmt::result<int, int> copy(err1);
  EXPECT_FALSE((bool)copy);
  EXPECT_EQUAL(10, copy.error());

  copy = value1;
  ASSERT_TRUE((bool)copy);
  EXPECT_EQUAL(20, *copy);

  copy = std::move(err1);
  EXPECT_FALSE((bool)copy);
  EXPECT_EQUAL(10, copy.error());
}

TEST(result_move_keeps_errorness) {
  tyfmt::result<std::unique_ptr<int>, int> move_only1(tyfmt::in_place_t{},
                                                      std::make_unique<int>(10));
  tyfmt::result<std::unique_ptr<int>, int> move_only2(std::move(move_only1));
  EXPECT_TRUE((bool)move_only1);
  ASSERT_TRUE((bool)move_only2);
  EXPECT_EQUAL(10, **move_only2);
  EXPECT_TRUE(move_only1->get() == nullptr);

  tyfmt::result<int, std::unique_ptr<int>> err1(tyfmt::in_place_error_t{},
                                                std::make_unique<int>(5));
  tyfmt::result<int, std::unique_ptr<int>> err2(std::move(err1));
  EXPECT_FALSE((bool)err1);
  EXPECT_FALSE((bool)err2);
  EXPECT_EQUAL(5, *err2.error());
  EXPECT_TRUE(err1.error().get() == nullptr);
}
