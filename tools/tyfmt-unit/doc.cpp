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

#include "unit.h"

TEST(doc_basic) {
  tyfmt::doc_builder builder;
  builder.append("Vec");
  builder.append("<");
  builder.append("u8");

  {
    tyfmt::doc_builder other;
    other.append(",");
    other.append(" String");
    tyfmt::doc d = std::move(other).build();
    builder.append(d);
  }
  builder.append(">");

  tyfmt::doc d = std::move(builder).build();
  std::string expected = "Vec<u8, String>";

  EXPECT_EQUAL(expected.size(), d.byte_count());
  EXPECT_EQUAL(expected, d.as_string());
}

TEST(doc_empty_builder) {
  tyfmt::doc_builder builder;
  tyfmt::doc d = std::move(builder).build();
  EXPECT_TRUE(d.is_empty());
  EXPECT_EQUAL("", d.as_string());
  EXPECT_EQUAL(1u, d.height());
}

TEST(doc_undo) {
  tyfmt::doc_builder builder;
  builder.append("Foo");
  builder.append("::");
  builder.append("Bar");

  builder.undo();
  EXPECT_EQUAL(5u, builder.last_width());

  builder.undo();
  EXPECT_EQUAL(3u, builder.last_width());

  tyfmt::doc d = std::move(builder).build();
  EXPECT_EQUAL("Foo", d.as_string());
}

TEST(doc_geometry) {
  {
    tyfmt::doc_builder builder;
    builder.append("Hello");

    EXPECT_EQUAL(5u, builder.first_width());
    EXPECT_EQUAL(5u, builder.last_width());
    EXPECT_EQUAL(5u, builder.max_width());
    EXPECT_EQUAL(0u, builder.newline_count());
    EXPECT_EQUAL(1u, builder.height());

    tyfmt::doc d = std::move(builder).build();

    EXPECT_EQUAL(5u, d.first_width());
    EXPECT_EQUAL(5u, d.last_width());
    EXPECT_EQUAL(5u, d.max_width());
    EXPECT_EQUAL(0u, d.newline_count());
    EXPECT_FALSE(d.has_newline());
  }

  {
    tyfmt::doc_builder builder;
    builder.append("Foo<A,\n");
    builder.append("    B>");

    EXPECT_EQUAL(6u, builder.first_width());
    EXPECT_EQUAL(6u, builder.last_width());
    EXPECT_EQUAL(6u, builder.max_width());
    EXPECT_EQUAL(1u, builder.newline_count());
    EXPECT_EQUAL(2u, builder.height());

    tyfmt::doc d = std::move(builder).build();

    EXPECT_EQUAL(6u, d.first_width());
    EXPECT_EQUAL(6u, d.last_width());
    EXPECT_TRUE(d.has_newline());
  }

  {
    tyfmt::doc_builder builder;
    builder.append("He\nllo");
    builder.append("Worl\nd!");

    EXPECT_EQUAL(2u, builder.first_width());
    EXPECT_EQUAL(2u, builder.last_width());
    EXPECT_EQUAL(7u, builder.max_width());
    EXPECT_EQUAL(2u, builder.newline_count());
    EXPECT_EQUAL(3u, builder.height());

    tyfmt::doc d = std::move(builder).build();

    EXPECT_EQUAL(2u, d.first_width());
    EXPECT_EQUAL(2u, d.last_width());
    EXPECT_EQUAL(7u, d.max_width());
    EXPECT_EQUAL(2u, d.newline_count());
    EXPECT_EQUAL(3u, d.height());
  }
}

TEST(doc_concat_geometry) {
  tyfmt::doc left = tyfmt::doc::lit("for<'a> ");
  tyfmt::doc right = tyfmt::doc::lit("Fn(A,\n   B)");
  tyfmt::doc d = left.concat(right);

  EXPECT_EQUAL("for<'a> Fn(A,\n   B)", d.as_string());
  EXPECT_EQUAL(13u, d.first_width());
  EXPECT_EQUAL(5u, d.last_width());
  EXPECT_EQUAL(13u, d.max_width());
}

TEST(doc_width_counts_columns) {
  // Two bytes, one column
  tyfmt::doc accented = tyfmt::doc::lit("\xc3\xa9");
  EXPECT_EQUAL(2u, accented.byte_count());
  EXPECT_EQUAL(1u, accented.last_width());

  // Three bytes, two columns
  tyfmt::doc wide = tyfmt::doc::lit("\xe6\x97\xa5");
  EXPECT_EQUAL(3u, wide.byte_count());
  EXPECT_EQUAL(2u, wide.last_width());

  EXPECT_EQUAL(4u, tyfmt::str_width("T\xc3\xa9st"));
}

TEST(doc_invalid_utf8_is_one_column_per_byte) {
  tyfmt::doc d = tyfmt::doc::lit("a\xff\xfe");
  EXPECT_EQUAL(3u, d.byte_count());
  EXPECT_EQUAL(3u, d.last_width());
}
