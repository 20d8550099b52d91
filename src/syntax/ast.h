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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "span.h"

// The type-level syntax tree consumed by the renderers. Nodes are produced by
// a parser outside of this library and are only ever read here.
//
// Nodes with several shapes carry a `kind` tag and the fields of every shape;
// only the fields of the active shape are meaningful. Use the factory
// functions at the bottom of this file to build them.

namespace tyfmt {
namespace ast {

struct Ty;
using TyPtr = std::unique_ptr<Ty>;

// `'a`; the name includes the apostrophe
struct Lifetime {
  std::string name;
  Span span;
};

// `'a: 'b + 'c` as declared in a generics list or a `for<...>` binder
struct LifetimeDef {
  Lifetime lifetime;
  std::vector<Lifetime> bounds;
};

// `Item = U` inside an angle bracketed argument list
struct TypeBinding {
  std::string ident;
  TyPtr ty;
  Span span;
};

enum class PathParametersKind {
  None,
  // Foo<'a, T, Item = U>
  AngleBracketed,
  // Fn(A, B) -> C
  Parenthesized,
};

struct PathParameters {
  PathParametersKind kind = PathParametersKind::None;

  // AngleBracketed
  std::vector<Lifetime> lifetimes;
  std::vector<TyPtr> types;
  std::vector<TypeBinding> bindings;

  // Parenthesized
  std::vector<TyPtr> inputs;
  TyPtr output;

  bool is_empty() const {
    switch (kind) {
      case PathParametersKind::None:
        return true;
      case PathParametersKind::AngleBracketed:
        return lifetimes.empty() && types.empty() && bindings.empty();
      case PathParametersKind::Parenthesized:
        return false;
    }
    return true;
  }
};

struct PathSegment {
  std::string identifier;
  PathParameters parameters;
};

struct Path {
  Span span;
  // A leading `::`
  bool global = false;
  std::vector<PathSegment> segments;
};

// The `<Ty as Trait>` part of `<Ty as Trait>::Item`. `position` counts the
// leading segments of the accompanying path that name the trait, so for
// `<Vec<T> as IntoIterator>::Item` the path is `IntoIterator::Item` and
// position is 1. A position of 0 is `<Ty>::Item`.
struct QSelf {
  TyPtr ty;
  size_t position = 0;
};

struct TraitRef {
  Path path;
};

// `for<'a> Fn(&'a T)`
struct PolyTraitRef {
  std::vector<LifetimeDef> bound_lifetimes;
  TraitRef trait_ref;
  Span span;
};

enum class TraitBoundModifier {
  None,
  // ?Sized
  Maybe,
};

enum class TyParamBoundKind {
  Trait,
  Region,
};

struct TyParamBound {
  TyParamBoundKind kind = TyParamBoundKind::Trait;

  // Trait
  PolyTraitRef trait;
  TraitBoundModifier modifier = TraitBoundModifier::None;

  // Region
  Lifetime lifetime;

  Span span() const { return kind == TyParamBoundKind::Trait ? trait.span : lifetime.span; }
};

enum class Mutability {
  Immutable,
  Mutable,
};

enum class TyKind {
  // Vec<T>, <T as Trait>::Item
  Path,
  // &'a mut T
  Rptr,
  // *const T
  Ptr,
  // [T]
  Slice,
  // [T; N]
  Array,
  // (A, B)
  Tup,
  // (T)
  Paren,
  // _
  Infer,
  // !
  Never,
  // Trait + Send + 'a
  TraitObject,
  // for<'a> fn(&'a T) -> U
  BareFn,
};

struct Ty {
  TyKind kind = TyKind::Infer;
  Span span;

  // Path
  std::unique_ptr<QSelf> qself;
  Path path;

  // Rptr
  bool has_lifetime = false;
  Lifetime lifetime;

  // Rptr, Ptr
  Mutability mutbl = Mutability::Immutable;

  // Rptr, Ptr, Slice, Array, Paren: the single element type
  // Tup: the element types
  // BareFn: the input types
  std::vector<TyPtr> elems;

  // Array: the raw text of the length expression
  std::string length;

  // TraitObject
  std::vector<TyParamBound> bounds;

  // BareFn
  std::vector<LifetimeDef> bound_lifetimes;
  TyPtr output;

  const Ty &elem() const { return *elems.front(); }
};

// `T: Clone + 'a = Default` in a generics list. `span` covers only the
// identifier.
struct TyParam {
  std::string ident;
  std::vector<TyParamBound> bounds;
  TyPtr default_;
  Span span;
};

enum class WherePredicateKind {
  // for<'a> T: Trait<'a> + Send
  Bound,
  // 'a: 'b + 'c
  Region,
  // T::Item = U
  Eq,
};

struct WherePredicate {
  WherePredicateKind kind = WherePredicateKind::Bound;
  Span span;

  // Bound
  std::vector<LifetimeDef> bound_lifetimes;
  TyPtr bounded_ty;
  std::vector<TyParamBound> bounds;

  // Region
  Lifetime lifetime;
  std::vector<Lifetime> region_bounds;

  // Eq
  Path path;
  TyPtr ty;
};

struct WhereClause {
  std::vector<WherePredicate> predicates;
};

// `<'a, T: 'a>`; `span` covers the angle brackets.
struct Generics {
  std::vector<LifetimeDef> lifetimes;
  std::vector<TyParam> ty_params;
  WhereClause where_clause;
  Span span;

  bool is_empty() const { return lifetimes.empty() && ty_params.empty(); }
};

Lifetime lifetime(std::string name, Span span);
LifetimeDef lifetime_def(Lifetime lifetime, std::vector<Lifetime> bounds = {});

PathSegment segment(std::string identifier);
PathSegment angle_segment(std::string identifier, std::vector<Lifetime> lifetimes,
                          std::vector<TyPtr> types, std::vector<TypeBinding> bindings = {});
PathSegment paren_segment(std::string identifier, std::vector<TyPtr> inputs, TyPtr output);
TypeBinding binding(std::string ident, TyPtr ty, Span span);

Path path(Span span, std::vector<PathSegment> segments, bool global = false);
QSelf qself(TyPtr ty, size_t position);

PolyTraitRef poly_trait_ref(std::vector<LifetimeDef> bound_lifetimes, Path path, Span span);
TyParamBound trait_bound(PolyTraitRef trait,
                         TraitBoundModifier modifier = TraitBoundModifier::None);
TyParamBound region_bound(Lifetime lifetime);

TyPtr ty_path(Path path, Span span);
TyPtr ty_qpath(QSelf qself, Path path, Span span);
TyPtr ty_rptr(Mutability mutbl, TyPtr elem, Span span);
TyPtr ty_rptr(Lifetime lifetime, Mutability mutbl, TyPtr elem, Span span);
TyPtr ty_ptr(Mutability mutbl, TyPtr elem, Span span);
TyPtr ty_slice(TyPtr elem, Span span);
TyPtr ty_array(TyPtr elem, std::string length, Span span);
TyPtr ty_tup(std::vector<TyPtr> elems, Span span);
TyPtr ty_paren(TyPtr elem, Span span);
TyPtr ty_infer(Span span);
TyPtr ty_never(Span span);
TyPtr ty_trait_object(std::vector<TyParamBound> bounds, Span span);
TyPtr ty_bare_fn(std::vector<LifetimeDef> bound_lifetimes, std::vector<TyPtr> inputs,
                 TyPtr output, Span span);

TyParam ty_param(std::string ident, Span span, std::vector<TyParamBound> bounds = {},
                 TyPtr default_ = nullptr);

WherePredicate bound_predicate(std::vector<LifetimeDef> bound_lifetimes, TyPtr bounded_ty,
                               std::vector<TyParamBound> bounds, Span span);
WherePredicate region_predicate(Lifetime lifetime, std::vector<Lifetime> bounds, Span span);
WherePredicate eq_predicate(Path path, TyPtr ty, Span span);

}  // namespace ast
}  // namespace tyfmt
