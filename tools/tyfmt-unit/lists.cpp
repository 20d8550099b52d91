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

#include "rewrite/lists.h"

#include "rewrite/config.h"
#include "test_util.h"
#include "unit.h"

using namespace tyfmt;

static std::vector<ListItem> plain_items(std::initializer_list<const char *> texts) {
  std::vector<ListItem> out;
  for (const char *text : texts) out.emplace_back(text);
  return out;
}

static ListFormatting formatting(ListTactic tactic, SeparatorTactic trailing, size_t indent,
                                 size_t width) {
  return ListFormatting{tactic, ",", trailing, indent, width, width, false, nullptr};
}

TEST(lists_horizontal_and_vertical) {
  auto items = plain_items({"a", "b", "c"});

  EXPECT_EQUAL("a, b, c",
               write_list(items, formatting(ListTactic::Horizontal, SeparatorTactic::Never, 2, 4))
                   .as_string());
  EXPECT_EQUAL("a,\n  b,\n  c",
               write_list(items, formatting(ListTactic::Vertical, SeparatorTactic::Never, 2, 80))
                   .as_string());
  EXPECT_EQUAL("", write_list({}, formatting(ListTactic::Vertical, SeparatorTactic::Never, 2, 80))
                       .as_string());
}

TEST(lists_horizontal_vertical_threshold) {
  auto items = plain_items({"A", "B", "C"});

  // 3 items + 2 separators of ", "
  EXPECT_EQUAL("A, B, C", write_list(items, formatting(ListTactic::HorizontalVertical,
                                                       SeparatorTactic::Never, 4, 7))
                              .as_string());
  EXPECT_EQUAL("A,\n    B,\n    C", write_list(items, formatting(ListTactic::HorizontalVertical,
                                                                 SeparatorTactic::Never, 4, 6))
                                        .as_string());

  auto multiline = plain_items({"A", "B\n  C"});
  EXPECT_EQUAL("A,\n B\n  C", write_list(multiline, formatting(ListTactic::HorizontalVertical,
                                                               SeparatorTactic::Never, 1, 80))
                                  .as_string());
}

TEST(lists_trailing_separator) {
  auto items = plain_items({"a", "b"});

  EXPECT_EQUAL("a, b,",
               write_list(items, formatting(ListTactic::Horizontal, SeparatorTactic::Always, 0, 80))
                   .as_string());
  EXPECT_EQUAL("a, b", write_list(items, formatting(ListTactic::Horizontal,
                                                    SeparatorTactic::Vertical, 0, 80))
                           .as_string());
  EXPECT_EQUAL("a,\nb,", write_list(items, formatting(ListTactic::Vertical,
                                                      SeparatorTactic::Vertical, 0, 80))
                             .as_string());
}

TEST(lists_mixed) {
  auto items = plain_items({"aa", "bb", "cc"});

  EXPECT_EQUAL("aa, bb,\ncc",
               write_list(items, formatting(ListTactic::Mixed, SeparatorTactic::Never, 0, 6))
                   .as_string());
  EXPECT_EQUAL("aa, bb, cc",
               write_list(items, formatting(ListTactic::Mixed, SeparatorTactic::Never, 0, 10))
                   .as_string());
}

TEST(lists_line_pre_comment_forces_vertical) {
  auto items = plain_items({"a", "b"});
  items[1].pre_comment = some(std::string("// second"));

  EXPECT_EQUAL("a,\n  // second\n  b",
               write_list(items, formatting(ListTactic::Horizontal, SeparatorTactic::Never, 2, 80))
                   .as_string());
}

TEST(lists_itemize_comments) {
  Fixture f("(a /* one */, /* two */ b, // three\n c)");
  SpanCursor cur = f.cursor();
  std::vector<Span> spans;
  cur.next("(");
  spans.push_back(cur.next("a"));
  spans.push_back(cur.next("b"));
  spans.push_back(cur.next("c"));
  BytePos end = static_cast<BytePos>(f.source.size());

  auto items = itemize_list(
      f.codemap, spans.begin(), spans.end(), ",", ")", [](const Span &s) { return s.lo; },
      [](const Span &s) { return s.hi; },
      [&f](const Span &s) { return *f.codemap.span_to_snippet(s); }, 1, end);

  ASSERT_EQUAL(3u, items.size());

  EXPECT_FALSE((bool)items[0].pre_comment);
  EXPECT_EQUAL("a", items[0].item);
  ASSERT_TRUE((bool)items[0].post_comment);
  EXPECT_EQUAL("/* one */", *items[0].post_comment);

  ASSERT_TRUE((bool)items[1].pre_comment);
  EXPECT_EQUAL("/* two */", *items[1].pre_comment);
  ASSERT_TRUE((bool)items[1].post_comment);
  EXPECT_EQUAL("// three", *items[1].post_comment);

  EXPECT_FALSE((bool)items[2].pre_comment);
  EXPECT_FALSE((bool)items[2].post_comment);
}

TEST(lists_comments_written_inline_or_after_separator) {
  Fixture f("(a, // one\n b)");
  SpanCursor cur = f.cursor();
  std::vector<Span> spans;
  cur.next("(");
  spans.push_back(cur.next("a"));
  spans.push_back(cur.next("b"));

  auto items = itemize_list(
      f.codemap, spans.begin(), spans.end(), ",", ")", [](const Span &s) { return s.lo; },
      [](const Span &s) { return s.hi; },
      [&f](const Span &s) { return *f.codemap.span_to_snippet(s); }, 1, 14);

  EXPECT_EQUAL("a /* one */, b", write_list(items, formatting(ListTactic::HorizontalVertical,
                                                              SeparatorTactic::Never, 1, 80))
                                     .as_string());
  EXPECT_EQUAL("a, // one\n b",
               write_list(items, formatting(ListTactic::Vertical, SeparatorTactic::Never, 1, 80))
                   .as_string());
}
