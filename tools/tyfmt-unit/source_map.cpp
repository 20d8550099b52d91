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

#include <sstream>

#include "syntax/source_map.h"
#include "unit.h"

TEST(source_map_snippet) {
  tyfmt::SourceMap map("lib.rs", "type A = Vec<u8>;");

  auto snippet = map.span_to_snippet(tyfmt::mk_sp(9, 16));
  ASSERT_TRUE((bool)snippet);
  EXPECT_EQUAL("Vec<u8>", *snippet);

  auto empty = map.span_to_snippet(tyfmt::mk_sp(4, 4));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("", *empty);

  EXPECT_FALSE((bool)map.span_to_snippet(tyfmt::mk_sp(9, 4)));
  EXPECT_FALSE((bool)map.span_to_snippet(tyfmt::mk_sp(9, 100)));
}

TEST(source_map_span_after) {
  tyfmt::SourceMap map("lib.rs", "Foo::<A, B>::bar<C>");

  auto open = map.span_after(tyfmt::mk_sp(0, 19), "<");
  ASSERT_TRUE((bool)open);
  EXPECT_EQUAL(6u, *open);

  auto first = map.first_occurrence(tyfmt::mk_sp(7, 19), "<");
  ASSERT_TRUE((bool)first);
  EXPECT_EQUAL(16u, *first);

  EXPECT_FALSE((bool)map.span_after(tyfmt::mk_sp(0, 5), "<"));
}

TEST(source_map_coordinates) {
  tyfmt::SourceMap map("lib.rs", "fn f<T>()\nwhere\n    T: Clone {}");

  tyfmt::Coordinates start = map.coordinates(0);
  EXPECT_EQUAL(1, start.row);
  EXPECT_EQUAL(1, start.column);

  // The `T` of `T: Clone`
  tyfmt::Coordinates bound = map.coordinates(20);
  EXPECT_EQUAL(3, bound.row);
  EXPECT_EQUAL(5, bound.column);

  std::stringstream ss;
  ss << map.location(tyfmt::mk_sp(20, 28));
  EXPECT_EQUAL("lib.rs:3:[5-12]", ss.str());
}

TEST(source_map_coordinates_count_columns) {
  // The accented letter is two bytes wide but takes one column
  tyfmt::SourceMap map("lib.rs", "\xc3\xa9<T>");
  tyfmt::Coordinates open = map.coordinates(2);
  EXPECT_EQUAL(1, open.row);
  EXPECT_EQUAL(2, open.column);
}
