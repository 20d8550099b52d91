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

#include "syntax/pprust.h"

#include "test_util.h"
#include "unit.h"

using namespace tyfmt;

// Spans are irrelevant to the plain stringifier.
static const Span sp;

TEST(pprust_references_and_pointers) {
  EXPECT_EQUAL("&T", pprust::ty_to_string(*ast::ty_rptr(ast::Mutability::Immutable,
                                                           simple_ty("T", sp), sp)));
  EXPECT_EQUAL("&'a mut T",
               pprust::ty_to_string(*ast::ty_rptr(ast::lifetime("'a", sp), ast::Mutability::Mutable,
                                                  simple_ty("T", sp), sp)));
  EXPECT_EQUAL("*const u8", pprust::ty_to_string(*ast::ty_ptr(ast::Mutability::Immutable,
                                                                simple_ty("u8", sp), sp)));
  EXPECT_EQUAL("*mut u8", pprust::ty_to_string(*ast::ty_ptr(ast::Mutability::Mutable,
                                                              simple_ty("u8", sp), sp)));
}

TEST(pprust_sequences) {
  EXPECT_EQUAL("[T]", pprust::ty_to_string(*ast::ty_slice(simple_ty("T", sp), sp)));
  EXPECT_EQUAL("[u8; 4]", pprust::ty_to_string(*ast::ty_array(simple_ty("u8", sp), "4", sp)));
  EXPECT_EQUAL("()", pprust::ty_to_string(*ast::ty_tup({}, sp)));
  EXPECT_EQUAL("(A,)", pprust::ty_to_string(*ast::ty_tup(move_vec(simple_ty("A", sp)), sp)));
  EXPECT_EQUAL("(A, B)", pprust::ty_to_string(*ast::ty_tup(
                             move_vec(simple_ty("A", sp), simple_ty("B", sp)), sp)));
  EXPECT_EQUAL("(T)", pprust::ty_to_string(*ast::ty_paren(simple_ty("T", sp), sp)));
  EXPECT_EQUAL("_", pprust::ty_to_string(*ast::ty_infer(sp)));
  EXPECT_EQUAL("!", pprust::ty_to_string(*ast::ty_never(sp)));
}

TEST(pprust_paths) {
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("std"));
  segments.push_back(ast::angle_segment("HashMap", {ast::lifetime("'a", sp)},
                                        move_vec(simple_ty("K", sp), simple_ty("V", sp))));
  ast::Path path = ast::path(sp, std::move(segments), true);
  EXPECT_EQUAL("::std::HashMap<'a, K, V>", pprust::path_to_string(path));

  std::vector<ast::TypeBinding> bindings;
  bindings.push_back(ast::binding("Item", simple_ty("u8", sp), sp));
  std::vector<ast::PathSegment> iter;
  iter.push_back(ast::angle_segment("Iterator", {}, {}, std::move(bindings)));
  EXPECT_EQUAL("Iterator<Item = u8>", pprust::path_to_string(ast::path(sp, std::move(iter))));

  std::vector<ast::PathSegment> fn;
  fn.push_back(ast::paren_segment("Fn", move_vec(simple_ty("A", sp)), simple_ty("B", sp)));
  EXPECT_EQUAL("Fn(A) -> B", pprust::path_to_string(ast::path(sp, std::move(fn))));
}

TEST(pprust_qualified_paths) {
  std::vector<ast::PathSegment> segments;
  segments.push_back(ast::segment("IntoIterator"));
  segments.push_back(ast::segment("Item"));
  ast::TyPtr qualified = ast::ty_qpath(ast::qself(simple_ty("Vec<T>", sp), 1),
                                       ast::path(sp, std::move(segments)), sp);
  EXPECT_EQUAL("<Vec<T> as IntoIterator>::Item", pprust::ty_to_string(*qualified));

  std::vector<ast::PathSegment> assoc;
  assoc.push_back(ast::segment("Output"));
  ast::TyPtr bare =
      ast::ty_qpath(ast::qself(simple_ty("T", sp), 0), ast::path(sp, std::move(assoc)), sp);
  EXPECT_EQUAL("<T>::Output", pprust::ty_to_string(*bare));
}

static std::vector<ast::TyParamBound> mixed_bounds() {
  std::vector<ast::TyParamBound> bounds;
  bounds.push_back(simple_bound("Trait", sp));
  bounds.push_back(ast::region_bound(ast::lifetime("'a", sp)));
  bounds.push_back(simple_bound("Sized", sp, ast::TraitBoundModifier::Maybe));
  return bounds;
}

TEST(pprust_bounds) {
  EXPECT_EQUAL("Trait + 'a + ?Sized", pprust::bounds_to_string(mixed_bounds()));
  EXPECT_EQUAL("Trait + 'a + ?Sized",
               pprust::ty_to_string(*ast::ty_trait_object(mixed_bounds(), sp)));
}

TEST(pprust_higher_ranked) {
  std::vector<ast::LifetimeDef> binders;
  binders.push_back(ast::lifetime_def(ast::lifetime("'a", sp)));
  binders.push_back(ast::lifetime_def(ast::lifetime("'b", sp), {ast::lifetime("'a", sp)}));
  ast::PolyTraitRef poly = ast::poly_trait_ref(std::move(binders), simple_path("Fn", sp), sp);
  EXPECT_EQUAL("for<'a, 'b: 'a> Fn", pprust::poly_trait_ref_to_string(poly));

  std::vector<ast::LifetimeDef> fn_binders;
  fn_binders.push_back(ast::lifetime_def(ast::lifetime("'a", sp)));
  ast::TyPtr input = ast::ty_rptr(ast::lifetime("'a", sp), ast::Mutability::Immutable,
                                  simple_ty("T", sp), sp);
  ast::TyPtr bare_fn =
      ast::ty_bare_fn(std::move(fn_binders), move_vec(std::move(input)), simple_ty("U", sp), sp);
  EXPECT_EQUAL("for<'a> fn(&'a T) -> U", pprust::ty_to_string(*bare_fn));
}

TEST(pprust_lifetime_defs) {
  EXPECT_EQUAL("'a", pprust::lifetime_def_to_string(ast::lifetime_def(ast::lifetime("'a", sp))));
  EXPECT_EQUAL("'a: 'b + 'c", pprust::lifetime_def_to_string(ast::lifetime_def(
                                  ast::lifetime("'a", sp),
                                  {ast::lifetime("'b", sp), ast::lifetime("'c", sp)})));
}
