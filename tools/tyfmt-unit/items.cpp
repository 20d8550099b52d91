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

#include "rewrite/items.h"

#include "test_util.h"
#include "unit.h"

using namespace tyfmt;

// `T` and `U` with no bounds, spans taken from `f.source`.
static ast::Generics two_params(const Fixture &f) {
  SpanCursor cur = f.cursor();
  cur.next("<");
  Span t = cur.next("T");
  Span u = cur.next("U");
  ast::Generics generics;
  generics.ty_params.push_back(ast::ty_param("T", t));
  generics.ty_params.push_back(ast::ty_param("U", u));
  generics.span = mk_sp(0, static_cast<BytePos>(f.source.size()));
  return generics;
}

TEST(items_generics) {
  Fixture f("<'a, T: Clone + 'a, U = u8>");
  SpanCursor cur = f.cursor();
  Span a = cur.next("'a");
  Span t = cur.next("T");
  Span clone = cur.next("Clone");
  Span bound_a = cur.next("'a");
  Span u = cur.next("U");
  Span u8 = cur.next("u8");

  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(simple_bound("Clone", clone));
  bounds.push_back(ast::region_bound(ast::lifetime("'a", bound_a)));

  ast::Generics generics;
  generics.lifetimes.push_back(ast::lifetime_def(ast::lifetime("'a", a)));
  generics.ty_params.push_back(ast::ty_param("T", t, std::move(bounds)));
  generics.ty_params.push_back(ast::ty_param("U", u, {}, simple_ty("u8", u8)));
  generics.span = mk_sp(0, 27);

  EXPECT_EQUAL("<'a, T: Clone + 'a, U = u8>",
               show(rewrite_generics(f.context, generics, 0, generics.span)));

  Config narrow;
  narrow.max_width = 12;
  RewriteContext narrow_context(f.codemap, narrow);
  EXPECT_EQUAL("<'a,\n T: Clone + 'a,\n U = u8>",
               show(rewrite_generics(narrow_context, generics, 0, generics.span)));
  EXPECT_EQUAL("<'a,\n     T: Clone + 'a,\n     U = u8>",
               show(rewrite_generics(narrow_context, generics, 4, generics.span)));

  Config tiny;
  tiny.max_width = 1;
  RewriteContext tiny_context(f.codemap, tiny);
  EXPECT_EQUAL("<none>", show(rewrite_generics(tiny_context, generics, 0, generics.span)));
}

TEST(items_generics_empty) {
  Fixture f("");
  ast::Generics generics;
  EXPECT_EQUAL("", show(rewrite_generics(f.context, generics, 0, mk_sp(0, 0))));
}

TEST(items_ty_param_span) {
  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(simple_bound("Clone", mk_sp(3, 8)));
  ast::TyParam bounded = ast::ty_param("T", mk_sp(0, 1), std::move(bounds));
  EXPECT_TRUE(span_for_ty_param(bounded) == mk_sp(0, 8));

  ast::TyParam defaulted = ast::ty_param("T", mk_sp(0, 1), {}, simple_ty("u8", mk_sp(4, 6)));
  EXPECT_TRUE(span_for_ty_param(defaulted) == mk_sp(0, 6));

  ast::TyParam bare = ast::ty_param("T", mk_sp(0, 1));
  EXPECT_TRUE(span_for_ty_param(bare) == mk_sp(0, 1));
}

TEST(items_generics_keep_comments) {
  Fixture f("<T /* first */, U>");
  ast::Generics generics = two_params(f);
  EXPECT_EQUAL("<T /* first */, U>",
               show(rewrite_generics(f.context, generics, 0, generics.span)));

  Fixture g("<T, U // last\n>");
  ast::Generics last = two_params(g);
  EXPECT_EQUAL("<T, U /* last */>", show(rewrite_generics(g.context, last, 0, last.span)));
}

TEST(items_generics_line_comment_goes_vertical) {
  Fixture f("<// lead\n T,\n U>");
  ast::Generics generics = two_params(f);
  EXPECT_EQUAL("<// lead\n T,\n U>",
               show(rewrite_generics(f.context, generics, 0, generics.span)));
}

// `T: Clone, U: Send` followed by a block, spans taken from `f.source`.
static ast::WhereClause two_predicates(const Fixture &f) {
  SpanCursor cur = f.cursor();
  Span t = cur.next("T");
  Span clone = cur.next("Clone");
  Span u = cur.next("U");
  Span send = cur.next("Send");

  std::vector<ast::TyParamBound> first;
  first.push_back(simple_bound("Clone", clone));
  std::vector<ast::TyParamBound> second;
  second.push_back(simple_bound("Send", send));

  ast::WhereClause clause;
  clause.predicates.push_back(
      ast::bound_predicate({}, simple_ty("T", t), std::move(first), mk_sp(t.lo, clone.hi)));
  clause.predicates.push_back(
      ast::bound_predicate({}, simple_ty("U", u), std::move(second), mk_sp(u.lo, send.hi)));
  return clause;
}

TEST(items_where_clause) {
  Fixture f("where T: Clone, U: Send {");
  ast::WhereClause clause = two_predicates(f);
  BytePos end = static_cast<BytePos>(f.source.size());

  EXPECT_EQUAL("\n    where T: Clone,\n          U: Send",
               show(rewrite_where_clause(f.context, clause, 0, end)));
  EXPECT_EQUAL("\n        where T: Clone,\n              U: Send",
               show(rewrite_where_clause(f.context, clause, 4, end)));
}

TEST(items_where_clause_layout) {
  Config horizontal;
  horizontal.where_layout = ListTactic::Horizontal;
  Fixture f("where T: Clone, U: Send {", horizontal);
  ast::WhereClause clause = two_predicates(f);
  BytePos end = static_cast<BytePos>(f.source.size());

  EXPECT_EQUAL("\n    where T: Clone, U: Send",
               show(rewrite_where_clause(f.context, clause, 0, end)));
}

TEST(items_where_clause_indent_styles) {
  Config inherit;
  inherit.where_indent = BlockIndentStyle::Inherit;
  inherit.where_pred_indent = BlockIndentStyle::Tabbed;
  Fixture f("where T: Clone, U: Send {", inherit);
  ast::WhereClause clause = two_predicates(f);
  BytePos end = static_cast<BytePos>(f.source.size());

  EXPECT_EQUAL("\n    where T: Clone,\n        U: Send",
               show(rewrite_where_clause(f.context, clause, 4, end)));

  Config flat;
  flat.where_indent = BlockIndentStyle::Inherit;
  flat.where_pred_indent = BlockIndentStyle::Inherit;
  RewriteContext flat_context(f.codemap, flat);
  EXPECT_EQUAL("\nwhere T: Clone,\nU: Send",
               show(rewrite_where_clause(flat_context, clause, 0, end)));
}

TEST(items_where_clause_keeps_comments) {
  Fixture f("where T: Clone, // cloned\n U: Send {");
  ast::WhereClause clause = two_predicates(f);
  BytePos end = static_cast<BytePos>(f.source.size());

  EXPECT_EQUAL("\n    where T: Clone, // cloned\n          U: Send",
               show(rewrite_where_clause(f.context, clause, 0, end)));
}

TEST(items_where_clause_budget) {
  Config cramped;
  cramped.ideal_width = 5;
  cramped.leeway = 0;
  Fixture f("where T: Clone, U: Send {", cramped);
  ast::WhereClause clause = two_predicates(f);
  BytePos end = static_cast<BytePos>(f.source.size());

  EXPECT_EQUAL("<none>", show(rewrite_where_clause(f.context, clause, 0, end)));

  ast::WhereClause empty;
  EXPECT_EQUAL("", show(rewrite_where_clause(f.context, empty, 0, end)));
}
