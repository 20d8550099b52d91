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

#include "test_util.h"
#include "unit.h"

using namespace tyfmt;

TEST(bounds_maybe_sized) {
  Fixture f("?Sized");
  ast::TyParamBound bound = simple_bound("Sized", mk_sp(1, 6), ast::TraitBoundModifier::Maybe);

  EXPECT_EQUAL("?Sized", show(rewrite(bound, f.context, 6, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(bound, f.context, 5, 0)));
}

TEST(bounds_region) {
  Fixture f("'a");
  ast::TyParamBound bound = ast::region_bound(ast::lifetime("'a", mk_sp(0, 2)));
  // Lifetimes are never measured
  EXPECT_EQUAL("'a", show(rewrite(bound, f.context, 0, 0)));
}

TEST(bounds_poly_trait_ref) {
  Fixture f("for<'a> Foo");
  ast::PolyTraitRef poly =
      ast::poly_trait_ref({ast::lifetime_def(ast::lifetime("'a", mk_sp(4, 6)))},
                          simple_path("Foo", mk_sp(8, 11)), mk_sp(0, 11));

  EXPECT_EQUAL("for<'a> Foo", show(rewrite(poly, f.context, 11, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(poly, f.context, 10, 0)));

  ast::PolyTraitRef plain =
      ast::poly_trait_ref({}, simple_path("Foo", mk_sp(8, 11)), mk_sp(8, 11));
  EXPECT_EQUAL("Foo", show(rewrite(plain, f.context, 3, 0)));
}

TEST(bounds_lifetime_def) {
  Fixture f("'a: 'b + 'c");
  ast::LifetimeDef def =
      ast::lifetime_def(ast::lifetime("'a", mk_sp(0, 2)),
                        {ast::lifetime("'b", mk_sp(4, 6)), ast::lifetime("'c", mk_sp(9, 11))});
  EXPECT_EQUAL("'a: 'b + 'c", show(rewrite(def, f.context, 100, 0)));
}

TEST(bounds_ty_param) {
  Fixture f("T: Clone = u8");
  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(simple_bound("Clone", mk_sp(3, 8)));
  ast::TyParam param =
      ast::ty_param("T", mk_sp(0, 1), std::move(bounds), simple_ty("u8", mk_sp(11, 13)));

  EXPECT_EQUAL("T: Clone = u8", show(rewrite(param, f.context, 100, 0)));
  // The bounds get the whole width, not what the identifier leaves
  EXPECT_EQUAL("T: Clone = u8", show(rewrite(param, f.context, 5, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(param, f.context, 4, 0)));

  ast::TyParam bare = ast::ty_param("U", mk_sp(0, 1));
  EXPECT_EQUAL("U", show(rewrite(bare, f.context, 0, 0)));
}

TEST(bounds_where_predicate) {
  Fixture f("T: Clone + Send");
  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(simple_bound("Clone", mk_sp(3, 8)));
  bounds.push_back(simple_bound("Send", mk_sp(11, 15)));
  ast::WherePredicate predicate =
      ast::bound_predicate({}, simple_ty("T", mk_sp(0, 1)), std::move(bounds), mk_sp(0, 15));

  EXPECT_EQUAL("T: Clone + Send", show(rewrite(predicate, f.context, 100, 0)));
  // Each bound is measured on its own against what `T: ` leaves
  EXPECT_EQUAL("T: Clone + Send", show(rewrite(predicate, f.context, 8, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(predicate, f.context, 7, 0)));
}

TEST(bounds_higher_ranked_predicate) {
  Fixture f("for<'a> F: Fn(&'a u8)");
  SpanCursor cur = f.cursor();
  Span binder = cur.next("'a");
  Span bounded = cur.next("F");
  Span fn = cur.next("Fn");
  Span ref = cur.next("&");
  Span ref_lifetime = cur.next("'a");
  Span u8 = cur.next("u8");
  BytePos end = static_cast<BytePos>(f.source.size());

  ast::TyPtr input = ast::ty_rptr(ast::lifetime("'a", ref_lifetime), ast::Mutability::Immutable,
                                  simple_ty("u8", u8), mk_sp(ref.lo, u8.hi));
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::paren_segment("Fn", move_vec(std::move(input)), nullptr));
  ast::Path path = ast::path(mk_sp(fn.lo, end), std::move(segments));

  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(ast::trait_bound(ast::poly_trait_ref({}, std::move(path), mk_sp(fn.lo, end))));
  ast::WherePredicate predicate =
      ast::bound_predicate({ast::lifetime_def(ast::lifetime("'a", binder))},
                           simple_ty("F", bounded), std::move(bounds), mk_sp(0, end));

  EXPECT_EQUAL("for<'a> F: Fn(&'a u8)", show(rewrite(predicate, f.context, 100, 0)));
}

TEST(bounds_region_predicate) {
  Fixture f("'a: 'b + 'c");
  ast::WherePredicate predicate = ast::region_predicate(
      ast::lifetime("'a", mk_sp(0, 2)),
      {ast::lifetime("'b", mk_sp(4, 6)), ast::lifetime("'c", mk_sp(9, 11))}, mk_sp(0, 11));
  EXPECT_EQUAL("'a: 'b + 'c", show(rewrite(predicate, f.context, 1, 0)));
}

TEST(bounds_eq_predicate) {
  Fixture f("T::Item = U");
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("T"));
  segments.push_back(ast::segment("Item"));
  ast::WherePredicate predicate = ast::eq_predicate(ast::path(mk_sp(0, 7), std::move(segments)),
                                                    simple_ty("U", mk_sp(10, 11)), mk_sp(0, 11));

  EXPECT_EQUAL("T::Item = U", show(rewrite(predicate, f.context, 11, 0)));
  EXPECT_EQUAL("<none>", show(rewrite(predicate, f.context, 10, 0)));
}
