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

#include "pprust.h"

#include <algorithm>
#include <sstream>

namespace tyfmt {
namespace pprust {

template <class T, class F>
static std::string join(const std::vector<T> &items, const char *sep, F &&show) {
  std::stringstream ss;
  bool first = true;
  for (const auto &item : items) {
    if (!first) ss << sep;
    first = false;
    ss << show(item);
  }
  return ss.str();
}

static std::string binders_to_string(const std::vector<ast::LifetimeDef> &defs) {
  if (defs.empty()) return "";
  return "for<" + join(defs, ", ", lifetime_def_to_string) + "> ";
}

static std::string ty_ptr_to_string(const ast::TyPtr &ty) { return ty_to_string(*ty); }

std::string lifetime_to_string(const ast::Lifetime &lifetime) { return lifetime.name; }

std::string lifetime_def_to_string(const ast::LifetimeDef &def) {
  std::string out = def.lifetime.name;
  if (!def.bounds.empty()) {
    out += ": " + join(def.bounds, " + ", lifetime_to_string);
  }
  return out;
}

std::string segment_to_string(const ast::PathSegment &segment) {
  const ast::PathParameters &params = segment.parameters;
  std::string out = segment.identifier;

  switch (params.kind) {
    case ast::PathParametersKind::None:
      break;
    case ast::PathParametersKind::AngleBracketed: {
      if (params.is_empty()) break;
      std::vector<std::string> parts;
      for (const auto &l : params.lifetimes) parts.push_back(l.name);
      for (const auto &t : params.types) parts.push_back(ty_to_string(*t));
      for (const auto &b : params.bindings) parts.push_back(b.ident + " = " + ty_to_string(*b.ty));
      out += "<" + join(parts, ", ", [](const std::string &s) { return s; }) + ">";
      break;
    }
    case ast::PathParametersKind::Parenthesized:
      out += "(" + join(params.inputs, ", ", ty_ptr_to_string) + ")";
      if (params.output) out += " -> " + ty_to_string(*params.output);
      break;
  }

  return out;
}

std::string path_to_string(const ast::Path &path) {
  std::string out = path.global ? "::" : "";
  return out + join(path.segments, "::", segment_to_string);
}

std::string qpath_to_string(const ast::QSelf &qself, const ast::Path &path) {
  std::string out = "<" + ty_to_string(*qself.ty);

  size_t position = std::min(qself.position, path.segments.size());
  if (position > 0) {
    out += " as ";
    if (path.global) out += "::";
    for (size_t i = 0; i < position; ++i) {
      if (i > 0) out += "::";
      out += segment_to_string(path.segments[i]);
    }
  }
  out += ">";

  for (size_t i = position; i < path.segments.size(); ++i) {
    out += "::" + segment_to_string(path.segments[i]);
  }
  return out;
}

std::string poly_trait_ref_to_string(const ast::PolyTraitRef &poly) {
  return binders_to_string(poly.bound_lifetimes) + path_to_string(poly.trait_ref.path);
}

std::string bound_to_string(const ast::TyParamBound &bound) {
  if (bound.kind == ast::TyParamBoundKind::Region) return bound.lifetime.name;
  std::string prefix = bound.modifier == ast::TraitBoundModifier::Maybe ? "?" : "";
  return prefix + poly_trait_ref_to_string(bound.trait);
}

std::string bounds_to_string(const std::vector<ast::TyParamBound> &bounds) {
  return join(bounds, " + ", bound_to_string);
}

static const char *mutbl_prefix(ast::Mutability mutbl, const char *immutable) {
  return mutbl == ast::Mutability::Mutable ? "mut " : immutable;
}

std::string ty_to_string(const ast::Ty &ty) {
  switch (ty.kind) {
    case ast::TyKind::Path:
      if (ty.qself) return qpath_to_string(*ty.qself, ty.path);
      return path_to_string(ty.path);
    case ast::TyKind::Rptr: {
      std::string out = "&";
      if (ty.has_lifetime) out += ty.lifetime.name + " ";
      return out + mutbl_prefix(ty.mutbl, "") + ty_to_string(ty.elem());
    }
    case ast::TyKind::Ptr:
      return std::string("*") + mutbl_prefix(ty.mutbl, "const ") + ty_to_string(ty.elem());
    case ast::TyKind::Slice:
      return "[" + ty_to_string(ty.elem()) + "]";
    case ast::TyKind::Array:
      return "[" + ty_to_string(ty.elem()) + "; " + ty.length + "]";
    case ast::TyKind::Tup:
      if (ty.elems.size() == 1) return "(" + ty_to_string(ty.elem()) + ",)";
      return "(" + join(ty.elems, ", ", ty_ptr_to_string) + ")";
    case ast::TyKind::Paren:
      return "(" + ty_to_string(ty.elem()) + ")";
    case ast::TyKind::Infer:
      return "_";
    case ast::TyKind::Never:
      return "!";
    case ast::TyKind::TraitObject:
      return bounds_to_string(ty.bounds);
    case ast::TyKind::BareFn: {
      std::string out = binders_to_string(ty.bound_lifetimes);
      out += "fn(" + join(ty.elems, ", ", ty_ptr_to_string) + ")";
      if (ty.output) out += " -> " + ty_to_string(*ty.output);
      return out;
    }
  }
  return "";
}

}  // namespace pprust
}  // namespace tyfmt
