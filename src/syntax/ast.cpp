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

#include "ast.h"

namespace tyfmt {
namespace ast {

Lifetime lifetime(std::string name, Span span) {
  Lifetime out;
  out.name = std::move(name);
  out.span = span;
  return out;
}

LifetimeDef lifetime_def(Lifetime lifetime, std::vector<Lifetime> bounds) {
  LifetimeDef out;
  out.lifetime = std::move(lifetime);
  out.bounds = std::move(bounds);
  return out;
}

PathSegment segment(std::string identifier) {
  PathSegment out;
  out.identifier = std::move(identifier);
  return out;
}

PathSegment angle_segment(std::string identifier, std::vector<Lifetime> lifetimes,
                          std::vector<TyPtr> types, std::vector<TypeBinding> bindings) {
  PathSegment out;
  out.identifier = std::move(identifier);
  out.parameters.kind = PathParametersKind::AngleBracketed;
  out.parameters.lifetimes = std::move(lifetimes);
  out.parameters.types = std::move(types);
  out.parameters.bindings = std::move(bindings);
  return out;
}

PathSegment paren_segment(std::string identifier, std::vector<TyPtr> inputs, TyPtr output) {
  PathSegment out;
  out.identifier = std::move(identifier);
  out.parameters.kind = PathParametersKind::Parenthesized;
  out.parameters.inputs = std::move(inputs);
  out.parameters.output = std::move(output);
  return out;
}

TypeBinding binding(std::string ident, TyPtr ty, Span span) {
  TypeBinding out;
  out.ident = std::move(ident);
  out.ty = std::move(ty);
  out.span = span;
  return out;
}

Path path(Span span, std::vector<PathSegment> segments, bool global) {
  Path out;
  out.span = span;
  out.global = global;
  out.segments = std::move(segments);
  return out;
}

QSelf qself(TyPtr ty, size_t position) {
  QSelf out;
  out.ty = std::move(ty);
  out.position = position;
  return out;
}

PolyTraitRef poly_trait_ref(std::vector<LifetimeDef> bound_lifetimes, Path path, Span span) {
  PolyTraitRef out;
  out.bound_lifetimes = std::move(bound_lifetimes);
  out.trait_ref.path = std::move(path);
  out.span = span;
  return out;
}

TyParamBound trait_bound(PolyTraitRef trait, TraitBoundModifier modifier) {
  TyParamBound out;
  out.kind = TyParamBoundKind::Trait;
  out.trait = std::move(trait);
  out.modifier = modifier;
  return out;
}

TyParamBound region_bound(Lifetime lifetime) {
  TyParamBound out;
  out.kind = TyParamBoundKind::Region;
  out.lifetime = std::move(lifetime);
  return out;
}

static TyPtr make_ty(TyKind kind, Span span) {
  TyPtr out = std::make_unique<Ty>();
  out->kind = kind;
  out->span = span;
  return out;
}

TyPtr ty_path(Path path, Span span) {
  TyPtr out = make_ty(TyKind::Path, span);
  out->path = std::move(path);
  return out;
}

TyPtr ty_qpath(QSelf qself, Path path, Span span) {
  TyPtr out = make_ty(TyKind::Path, span);
  out->qself = std::make_unique<QSelf>(std::move(qself));
  out->path = std::move(path);
  return out;
}

TyPtr ty_rptr(Mutability mutbl, TyPtr elem, Span span) {
  TyPtr out = make_ty(TyKind::Rptr, span);
  out->mutbl = mutbl;
  out->elems.push_back(std::move(elem));
  return out;
}

TyPtr ty_rptr(Lifetime lifetime, Mutability mutbl, TyPtr elem, Span span) {
  TyPtr out = ty_rptr(mutbl, std::move(elem), span);
  out->has_lifetime = true;
  out->lifetime = std::move(lifetime);
  return out;
}

TyPtr ty_ptr(Mutability mutbl, TyPtr elem, Span span) {
  TyPtr out = make_ty(TyKind::Ptr, span);
  out->mutbl = mutbl;
  out->elems.push_back(std::move(elem));
  return out;
}

TyPtr ty_slice(TyPtr elem, Span span) {
  TyPtr out = make_ty(TyKind::Slice, span);
  out->elems.push_back(std::move(elem));
  return out;
}

TyPtr ty_array(TyPtr elem, std::string length, Span span) {
  TyPtr out = make_ty(TyKind::Array, span);
  out->elems.push_back(std::move(elem));
  out->length = std::move(length);
  return out;
}

TyPtr ty_tup(std::vector<TyPtr> elems, Span span) {
  TyPtr out = make_ty(TyKind::Tup, span);
  out->elems = std::move(elems);
  return out;
}

TyPtr ty_paren(TyPtr elem, Span span) {
  TyPtr out = make_ty(TyKind::Paren, span);
  out->elems.push_back(std::move(elem));
  return out;
}

TyPtr ty_infer(Span span) { return make_ty(TyKind::Infer, span); }

TyPtr ty_never(Span span) { return make_ty(TyKind::Never, span); }

TyPtr ty_trait_object(std::vector<TyParamBound> bounds, Span span) {
  TyPtr out = make_ty(TyKind::TraitObject, span);
  out->bounds = std::move(bounds);
  return out;
}

TyPtr ty_bare_fn(std::vector<LifetimeDef> bound_lifetimes, std::vector<TyPtr> inputs,
                 TyPtr output, Span span) {
  TyPtr out = make_ty(TyKind::BareFn, span);
  out->bound_lifetimes = std::move(bound_lifetimes);
  out->elems = std::move(inputs);
  out->output = std::move(output);
  return out;
}

TyParam ty_param(std::string ident, Span span, std::vector<TyParamBound> bounds, TyPtr default_) {
  TyParam out;
  out.ident = std::move(ident);
  out.span = span;
  out.bounds = std::move(bounds);
  out.default_ = std::move(default_);
  return out;
}

WherePredicate bound_predicate(std::vector<LifetimeDef> bound_lifetimes, TyPtr bounded_ty,
                               std::vector<TyParamBound> bounds, Span span) {
  WherePredicate out;
  out.kind = WherePredicateKind::Bound;
  out.span = span;
  out.bound_lifetimes = std::move(bound_lifetimes);
  out.bounded_ty = std::move(bounded_ty);
  out.bounds = std::move(bounds);
  return out;
}

WherePredicate region_predicate(Lifetime lifetime, std::vector<Lifetime> bounds, Span span) {
  WherePredicate out;
  out.kind = WherePredicateKind::Region;
  out.span = span;
  out.lifetime = std::move(lifetime);
  out.region_bounds = std::move(bounds);
  return out;
}

WherePredicate eq_predicate(Path path, TyPtr ty, Span span) {
  WherePredicate out;
  out.kind = WherePredicateKind::Eq;
  out.span = span;
  out.path = std::move(path);
  out.ty = std::move(ty);
  return out;
}

}  // namespace ast
}  // namespace tyfmt
