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

#include "rewrite/comment.h"

#include "rewrite/config.h"
#include "unit.h"

TEST(comment_find_uncommented) {
  auto in_block = tyfmt::find_uncommented("a /* , */ , b", ",");
  ASSERT_TRUE((bool)in_block);
  EXPECT_EQUAL(10u, *in_block);

  auto in_line = tyfmt::find_uncommented("// ,\n,", ",");
  ASSERT_TRUE((bool)in_line);
  EXPECT_EQUAL(5u, *in_line);

  auto in_string = tyfmt::find_uncommented("\",\" ,", ",");
  ASSERT_TRUE((bool)in_string);
  EXPECT_EQUAL(4u, *in_string);

  auto nested = tyfmt::find_uncommented("/* /* > */ > */ >", ">");
  ASSERT_TRUE((bool)nested);
  EXPECT_EQUAL(16u, *nested);

  EXPECT_FALSE((bool)tyfmt::find_uncommented("/* { */", "{"));
}

TEST(comment_find_comment_end) {
  auto line = tyfmt::find_comment_end("// x\ny");
  ASSERT_TRUE((bool)line);
  EXPECT_EQUAL(5u, *line);

  auto block = tyfmt::find_comment_end("/* x */ y");
  ASSERT_TRUE((bool)block);
  EXPECT_EQUAL(7u, *block);

  EXPECT_FALSE((bool)tyfmt::find_comment_end("/* open"));
  EXPECT_TRUE(tyfmt::contains_comment("A /* x */"));
  EXPECT_FALSE(tyfmt::contains_comment("\"/* x */\""));
}

TEST(comment_left_trim) {
  EXPECT_EQUAL("x", tyfmt::left_trim_comment_line("// x"));
  EXPECT_EQUAL("x", tyfmt::left_trim_comment_line("//x"));
  EXPECT_EQUAL("x */", tyfmt::left_trim_comment_line("/* x */"));
  EXPECT_EQUAL("x", tyfmt::left_trim_comment_line("* x"));
  EXPECT_EQUAL("x", tyfmt::left_trim_comment_line("*x"));
  EXPECT_EQUAL("x", tyfmt::left_trim_comment_line("x"));
}

TEST(comment_rewrite_styles) {
  tyfmt::Config config;
  EXPECT_EQUAL("// first", tyfmt::rewrite_comment("//first", false, 80, 0, config));
  EXPECT_EQUAL("/* first */", tyfmt::rewrite_comment("// first", true, 80, 0, config));
  EXPECT_EQUAL("// first", tyfmt::rewrite_comment("  /* first */  ", false, 80, 0, config));
  EXPECT_EQUAL("/* a\n   * b */", tyfmt::rewrite_comment("/* a\n * b */", true, 80, 2, config));
  EXPECT_EQUAL("// a\n  // b", tyfmt::rewrite_comment("// a\n// b", false, 80, 2, config));
}

TEST(comment_rewrite_wraps_long_lines) {
  tyfmt::Config config;
  EXPECT_EQUAL("// aaa bbb\n// ccc",
               tyfmt::rewrite_comment("// aaa bbb ccc", false, 10, 0, config));

  config.wrap_comments = false;
  EXPECT_EQUAL("// aaa bbb ccc", tyfmt::rewrite_comment("// aaa bbb ccc", false, 10, 0, config));
}

TEST(comment_rewrite_verbatim_without_normalizing) {
  tyfmt::Config config;
  config.normalize_comments = false;
  EXPECT_EQUAL("//x", tyfmt::rewrite_comment("  //x  ", true, 80, 0, config));
}
