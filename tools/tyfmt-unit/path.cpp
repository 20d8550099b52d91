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

#include "rewrite/types.h"

#include "rewrite/utils.h"
#include "test_util.h"
#include "unit.h"

using namespace tyfmt;

// `Foo<A, B, C>` with spans taken from `f.source`.
static ast::Path generic_path(const Fixture &f) {
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span a = cur.next("A");
  Span b = cur.next("B");
  Span c = cur.next("C");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment(
      "Foo", {}, move_vec(simple_ty("A", a), simple_ty("B", b), simple_ty("C", c))));
  return ast::path(mk_sp(0, static_cast<BytePos>(f.source.size())), std::move(segments));
}

TEST(path_generic_arguments_fit) {
  Fixture f("Foo<A, B, C>");
  ast::Path path = generic_path(f);

  EXPECT_EQUAL("Foo<A, B, C>", show(rewrite(path, f.context, 12, 0)));
  EXPECT_EQUAL("Foo<A,\n    B,\n    C>", show(rewrite(path, f.context, 11, 0)));
  EXPECT_EQUAL("Foo<A,\n        B,\n        C>", show(rewrite(path, f.context, 11, 4)));
}

TEST(path_identifier_too_wide) {
  Fixture f("Foo");
  EXPECT_EQUAL("Foo", show(rewrite(simple_path("Foo", mk_sp(0, 3)), f.context, 3, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(simple_path("Foo", mk_sp(0, 3)), f.context, 2, 0)));
}

TEST(path_global) {
  Fixture f("::std::Vec");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("std"));
  segments.push_back(ast::segment("Vec"));
  ast::Path path = ast::path(mk_sp(0, 10), std::move(segments), true);

  EXPECT_EQUAL("::std::Vec", show(rewrite(path, f.context, 10, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(path, f.context, 9, 0)));
}

TEST(path_turbofish) {
  Fixture f("Foo::<A, B>");
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span a = cur.next("A");
  Span b = cur.next("B");
  std::vector<ast::PathSegment> segments;
  segments.push_back(
      ast::angle_segment("Foo", {}, move_vec(simple_ty("A", a), simple_ty("B", b))));
  ast::Path path = ast::path(mk_sp(0, 11), std::move(segments));

  EXPECT_EQUAL("Foo::<A, B>", show(rewrite(path, f.context, 100, 0)));
}

TEST(path_argument_order) {
  Fixture f("Foo<'a, T, Item = U>");
  SpanCursor cur = f.cursor();
  Span a = cur.next("'a");
  Span t = cur.next("T");
  Span item = cur.next("Item");
  Span u = cur.next("U");

  std::vector<ast::TypeBinding> bindings;
  bindings.push_back(ast::binding("Item", simple_ty("U", u), mk_sp(item.lo, u.hi)));
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment("Foo", {ast::lifetime("'a", a)},
                                        move_vec(simple_ty("T", t)), std::move(bindings)));
  ast::Path path = ast::path(mk_sp(0, 20), std::move(segments));

  EXPECT_EQUAL("Foo<'a, T, Item = U>", show(rewrite(path, f.context, 100, 0)));
}

TEST(path_keeps_argument_comments) {
  Fixture f("Foo<A /* first */, B>");
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span a = cur.next("A");
  Span b = cur.next("B");
  std::vector<ast::PathSegment> segments;
  segments.push_back(
      ast::angle_segment("Foo", {}, move_vec(simple_ty("A", a), simple_ty("B", b))));
  ast::Path path = ast::path(mk_sp(0, 21), std::move(segments));

  EXPECT_EQUAL("Foo<A /* first */, B>", show(rewrite(path, f.context, 100, 0)));
}

TEST(path_segments_search_after_previous_arguments) {
  Fixture f("a::B<X>::c<Y>");
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span x = cur.next("X");
  cur.next("<");
  Span y = cur.next("Y");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("a"));
  segments.push_back(ast::angle_segment("B", {}, move_vec(simple_ty("X", x))));
  segments.push_back(ast::angle_segment("c", {}, move_vec(simple_ty("Y", y))));
  ast::Path path = ast::path(mk_sp(0, 13), std::move(segments));

  EXPECT_EQUAL("a::B<X>::c<Y>", show(rewrite(path, f.context, 100, 0)));
}

TEST(path_segment_after_multiline_arguments) {
  Fixture f("Foo<A, B, C>::bar");
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span a = cur.next("A");
  Span b = cur.next("B");
  Span c = cur.next("C");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment(
      "Foo", {}, move_vec(simple_ty("A", a), simple_ty("B", b), simple_ty("C", c))));
  segments.push_back(ast::segment("bar"));
  ast::Path path = ast::path(mk_sp(0, 17), std::move(segments));

  // The last row is `    C>::` when `bar` is placed
  EXPECT_EQUAL("Foo<A,\n    B,\n    C>::bar", show(rewrite(path, f.context, 11, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(path, f.context, 10, 0)));
}

TEST(path_missing_argument_list) {
  Fixture f("Foo X");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment("Foo", {}, move_vec(simple_ty("X", mk_sp(4, 5)))));
  ast::Path path = ast::path(mk_sp(0, 5), std::move(segments));

  EXPECT_EQUAL("<none>", show(rewrite(path, f.context, 100, 0)));
}

TEST(path_qualified_self) {
  Fixture f("<Foo as Bar>::baz");
  SpanCursor cur = f.cursor();
  Span foo = cur.next("Foo");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("Bar"));
  segments.push_back(ast::segment("baz"));
  ast::Path path = ast::path(mk_sp(0, 17), std::move(segments));
  ast::QSelf qself = ast::qself(simple_ty("Foo", foo), 1);

  EXPECT_EQUAL("<Foo as Bar>::baz", show(rewrite_path(f.context, &qself, path, 17, 0)));
  EXPECT_EQUAL("<none>", show(rewrite_path(f.context, &qself, path, 16, 0)));
}

TEST(path_qualified_self_trait_arguments) {
  Fixture f("<Foo as Bar<Y>>::baz<Z>");
  SpanCursor cur = f.cursor();
  Span foo = cur.next("Foo");
  cur.next("Bar<");
  Span y = cur.next("Y");
  cur.next("baz<");
  Span z = cur.next("Z");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment("Bar", {}, move_vec(simple_ty("Y", y))));
  segments.push_back(ast::angle_segment("baz", {}, move_vec(simple_ty("Z", z))));
  ast::Path path = ast::path(mk_sp(0, 23), std::move(segments));
  ast::QSelf qself = ast::qself(simple_ty("Foo", foo), 1);

  EXPECT_EQUAL("<Foo as Bar<Y>>::baz<Z>", show(rewrite_path(f.context, &qself, path, 100, 0)));
}

TEST(path_qualified_generic_self) {
  Fixture f("<Vec<T> as Into<U>>::x");
  SpanCursor cur = f.cursor();
  Span vec = cur.next("Vec");
  Span t = cur.next("T");
  cur.next("Into<");
  Span u = cur.next("U");

  std::vector<ast::PathSegment> self_segments;
  self_segments.push_back(ast::angle_segment("Vec", {}, move_vec(simple_ty("T", t))));
  Span self_span = mk_sp(vec.lo, t.hi + 1);
  ast::QSelf qself =
      ast::qself(ast::ty_path(ast::path(self_span, std::move(self_segments)), self_span), 1);

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment("Into", {}, move_vec(simple_ty("U", u))));
  segments.push_back(ast::segment("x"));
  ast::Path path = ast::path(mk_sp(0, 22), std::move(segments));

  EXPECT_EQUAL("<Vec<T> as Into<U>>::x", show(rewrite_path(f.context, &qself, path, 100, 0)));
}

TEST(path_qualified_self_global_trait) {
  Fixture f("<Foo as ::Bar>::baz");
  SpanCursor cur = f.cursor();
  Span foo = cur.next("Foo");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("Bar"));
  segments.push_back(ast::segment("baz"));
  ast::Path path = ast::path(mk_sp(0, 19), std::move(segments), true);
  ast::QSelf qself = ast::qself(simple_ty("Foo", foo), 1);

  // The leading `::` belongs to the trait inside the angle brackets
  EXPECT_EQUAL("<Foo as ::Bar>::baz", show(rewrite_path(f.context, &qself, path, 19, 0)));
  EXPECT_EQUAL("<none>", show(rewrite_path(f.context, &qself, path, 18, 0)));
}

TEST(path_qualified_self_without_trait) {
  Fixture f("<Foo>::baz");
  SpanCursor cur = f.cursor();
  Span foo = cur.next("Foo");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("baz"));
  ast::Path path = ast::path(mk_sp(0, 10), std::move(segments));
  ast::QSelf qself = ast::qself(simple_ty("Foo", foo), 0);

  EXPECT_EQUAL("<Foo>::baz", show(rewrite_path(f.context, &qself, path, 100, 0)));
}

TEST(path_parenthesized) {
  Fixture f("Fn(A, B) -> C");
  SpanCursor cur = f.cursor();
  cur.next("(");
  Span a = cur.next("A");
  Span b = cur.next("B");
  Span c = cur.next("C");

  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::paren_segment("Fn", move_vec(simple_ty("A", a), simple_ty("B", b)),
                                        simple_ty("C", c)));
  ast::Path path = ast::path(mk_sp(0, 13), std::move(segments));

  EXPECT_EQUAL("Fn(A, B) -> C", show(rewrite(path, f.context, 13, 0)));
  EXPECT_EQUAL("Fn(A,\n   B) -> C", show(rewrite(path, f.context, 12, 0)));
}

TEST(path_parenthesized_without_inputs) {
  Fixture f("Fn() -> C");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::paren_segment("Fn", {}, simple_ty("C", mk_sp(8, 9))));
  ast::Path path = ast::path(mk_sp(0, 9), std::move(segments));

  EXPECT_EQUAL("Fn() -> C", show(rewrite(path, f.context, 100, 0)));

  Fixture g("Fn()");
  std::vector<ast::PathSegment> bare;
  bare.push_back(ast::paren_segment("Fn", {}, nullptr));
  EXPECT_EQUAL("Fn()", show(rewrite(ast::path(mk_sp(0, 4), std::move(bare)), g.context, 4, 0)));
}

TEST(path_separator) {
  SourceMap expr("test.rs", "Vec::<T>");
  EXPECT_EQUAL("::", std::string(get_path_separator(expr, 0, 6)));

  SourceMap type("test.rs", "Vec <T>");
  EXPECT_EQUAL("", std::string(get_path_separator(type, 0, 5)));

  SourceMap spaced("test.rs", "Vec:: < T>");
  EXPECT_EQUAL("::", std::string(get_path_separator(spaced, 0, 7)));

  // Only whitespace and `<` before the start
  SourceMap empty("test.rs", " <T>");
  EXPECT_EQUAL("", std::string(get_path_separator(empty, 0, 2)));
}

TEST(path_separator_misread_through_comment) {
  // The scan does not know about comments
  Fixture f("Foo // a:\n<A>");
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span a = cur.next("A");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::angle_segment("Foo", {}, move_vec(simple_ty("A", a))));
  ast::Path path = ast::path(mk_sp(0, 13), std::move(segments));

  EXPECT_EQUAL("::", std::string(get_path_separator(f.codemap, 0, 11)));
  EXPECT_EQUAL("Foo::<A>", show(rewrite(path, f.context, 100, 0)));
}
