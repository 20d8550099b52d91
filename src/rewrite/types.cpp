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

#include "types.h"

#include <tyfmt/doc_state.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include "lists.h"
#include "syntax/pprust.h"
#include "utils.h"

namespace tyfmt {

// Appends the rendering of segments [begin, end) to `buffer`, joined by `::`.
// `width` and `offset` describe the line `buffer` started on.
static bool rewrite_path_segments(doc_builder &buffer,
                                  std::vector<ast::PathSegment>::const_iterator begin,
                                  std::vector<ast::PathSegment>::const_iterator end,
                                  BytePos &span_lo, BytePos span_hi,
                                  const RewriteContext &context, size_t width, size_t offset) {
  bool first = true;

  for (auto it = begin; it != end; ++it) {
    if (!first) buffer.append("::");
    first = false;

    size_t extra = extra_offset(buffer, offset);
    auto remaining = checked_sub(width, extra);
    if (!remaining) return false;

    auto segment = rewrite_segment(*it, span_lo, span_hi, context, *remaining, offset + extra);
    if (!segment) return false;

    buffer.append(*segment);
  }

  return true;
}

optional<doc> rewrite_path(const RewriteContext &context, const ast::QSelf *qself,
                           const ast::Path &path, size_t width, size_t offset) {
  size_t skip_count = qself ? std::min(qself->position, path.segments.size()) : 0;
  auto segments_begin = path.segments.begin();
  auto trait_end = segments_begin + skip_count;

  doc_builder result;
  // The `<` of a qualified self and any inside the self type open no argument
  // list of the path's segments.
  BytePos span_lo = qself ? qself->ty->span.hi : path.span.lo;

  if (path.global && !qself) result.append("::");

  if (qself) {
    result.append("<");
    result.append(pprust::ty_to_string(*qself->ty));

    if (skip_count > 0) {
      result.append(" as ");
      if (path.global) result.append("::");
    }

    // 3 = ">::".len()
    auto budget = checked_sub(width, extra_offset(result, offset) + 3);
    if (!budget) return {};

    if (!rewrite_path_segments(result, segments_begin, trait_end, span_lo, path.span.hi, context,
                               width - 3, offset)) {
      return {};
    }

    result.append(">::");
    span_lo = std::max<BytePos>(span_lo, qself->ty->span.hi + 1);
  }

  if (!rewrite_path_segments(result, trait_end, path.segments.end(), span_lo, path.span.hi,
                             context, width, offset)) {
    return {};
  }

  return some(std::move(result).build());
}

optional<doc> rewrite(const ast::Path &path, const RewriteContext &context, size_t width,
                      size_t offset) {
  return rewrite_path(context, nullptr, path, width, offset);
}

namespace {

// One generic argument of an angle bracketed list with its source extent.
struct SegmentParam {
  Span span;
  std::string text;
};

}  // namespace

static std::vector<SegmentParam> segment_params(const ast::PathParameters &params) {
  std::vector<SegmentParam> out;
  for (const auto &lifetime : params.lifetimes) {
    out.push_back(SegmentParam{lifetime.span, pprust::lifetime_to_string(lifetime)});
  }
  for (const auto &ty : params.types) {
    out.push_back(SegmentParam{ty->span, pprust::ty_to_string(*ty)});
  }
  for (const auto &binding : params.bindings) {
    out.push_back(
        SegmentParam{binding.span, binding.ident + " = " + pprust::ty_to_string(*binding.ty)});
  }
  return out;
}

static optional<doc> rewrite_angle_params(const ast::PathParameters &data, BytePos &span_lo,
                                          BytePos span_hi, const RewriteContext &context,
                                          size_t width, size_t offset) {
  std::vector<SegmentParam> params = segment_params(data);
  BytePos next_span_lo = params.back().span.hi + 1;

  auto list_lo = span_after(mk_sp(span_lo, span_hi), "<", context.codemap);
  if (!list_lo) return {};
  const char *separator = get_path_separator(context.codemap, span_lo, *list_lo);

  auto items = itemize_list(
      context.codemap, params.begin(), params.end(), ",", ">",
      [](const SegmentParam &param) { return param.span.lo; },
      [](const SegmentParam &param) { return param.span.hi; },
      [](const SegmentParam &param) { return param.text; }, *list_lo, span_hi);

  // 1 for <
  size_t extra = 1 + std::strlen(separator);
  // 1 for >
  auto list_width = checked_sub(width, extra + 1);
  if (!list_width) return {};

  ListFormatting fmt{ListTactic::HorizontalVertical,
                     ",",
                     SeparatorTactic::Never,
                     offset + extra,
                     *list_width,
                     *list_width,
                     false,
                     &context.config};

  span_lo = next_span_lo;

  doc_builder out;
  out.append(separator);
  out.append("<");
  out.append(write_list(items, fmt));
  out.append(">");
  return some(std::move(out).build());
}

static optional<doc> rewrite_paren_params(const ast::PathParameters &data, BytePos &span_lo,
                                          BytePos span_hi, const RewriteContext &context,
                                          size_t width, size_t offset) {
  std::string output = data.output ? " -> " + pprust::ty_to_string(*data.output) : "";

  auto list_lo = span_after(mk_sp(span_lo, span_hi), "(", context.codemap);
  if (!list_lo) return {};

  auto items = itemize_list(
      context.codemap, data.inputs.begin(), data.inputs.end(), ",", ")",
      [](const ast::TyPtr &ty) { return ty->span.lo; },
      [](const ast::TyPtr &ty) { return ty->span.hi; },
      [](const ast::TyPtr &ty) { return pprust::ty_to_string(*ty); }, *list_lo, span_hi);

  // 2 for ()
  auto budget = checked_sub(width, str_width(output) + 2);
  if (!budget) return {};

  // 1 for (
  ListFormatting fmt{ListTactic::HorizontalVertical,
                     ",",
                     SeparatorTactic::Never,
                     offset + 1,
                     *budget,
                     *budget,
                     false,
                     &context.config};

  span_lo = data.inputs.empty() ? *list_lo : data.inputs.back()->span.hi + 1;

  doc_builder out;
  out.append("(");
  out.append(write_list(items, fmt));
  out.append(")");
  out.append(output);
  return some(std::move(out).build());
}

optional<doc> rewrite_segment(const ast::PathSegment &segment, BytePos &span_lo, BytePos span_hi,
                              const RewriteContext &context, size_t width, size_t offset) {
  size_t ident_len = str_width(segment.identifier);
  auto remaining = checked_sub(width, ident_len);
  if (!remaining) return {};
  offset += ident_len;

  optional<doc> params = some(doc::empty());
  switch (segment.parameters.kind) {
    case ast::PathParametersKind::AngleBracketed:
      if (!segment.parameters.is_empty()) {
        params = rewrite_angle_params(segment.parameters, span_lo, span_hi, context, *remaining,
                                      offset);
      }
      break;
    case ast::PathParametersKind::Parenthesized:
      params =
          rewrite_paren_params(segment.parameters, span_lo, span_hi, context, *remaining, offset);
      break;
    case ast::PathParametersKind::None:
      break;
  }
  if (!params) return {};

  return some(doc::lit(segment.identifier).concat(*params));
}

// Joins the renderings of `bounds` with ` + `, each given the same budget.
static optional<doc> rewrite_bounds(const std::vector<ast::TyParamBound> &bounds,
                                    const RewriteContext &context, size_t width, size_t offset) {
  doc_builder out;
  bool first = true;
  for (const auto &bound : bounds) {
    if (!first) out.append(" + ");
    first = false;

    auto rendered = rewrite(bound, context, width, offset);
    if (!rendered) return {};
    out.append(*rendered);
  }
  return some(std::move(out).build());
}

static optional<std::string> rewrite_binders(const std::vector<ast::LifetimeDef> &defs,
                                             const RewriteContext &context, size_t width,
                                             size_t offset) {
  std::string out;
  for (const auto &def : defs) {
    auto rendered = rewrite(def, context, width, offset);
    if (!rendered) return {};
    if (!out.empty()) out += ", ";
    out += rendered->as_string();
  }
  return some(std::move(out));
}

optional<doc> rewrite(const ast::WherePredicate &predicate, const RewriteContext &context,
                      size_t width, size_t offset) {
  switch (predicate.kind) {
    case ast::WherePredicateKind::Bound: {
      std::string type_str = pprust::ty_to_string(*predicate.bounded_ty);
      doc_builder out;
      size_t used_width;

      if (!predicate.bound_lifetimes.empty()) {
        auto lifetime_str = rewrite_binders(predicate.bound_lifetimes, context, width, offset);
        if (!lifetime_str) return {};
        // 8 = "for<> : ".len()
        used_width = str_width(*lifetime_str) + str_width(type_str) + 8;
        out.append("for<" + *lifetime_str + "> ");
      } else {
        // 2 = ": ".len()
        used_width = str_width(type_str) + 2;
      }

      auto budget = checked_sub(width, used_width);
      if (!budget) return {};
      auto bounds = rewrite_bounds(predicate.bounds, context, *budget, offset + used_width);
      if (!bounds) return {};

      out.append(type_str + ": ");
      out.append(*bounds);
      return some(std::move(out).build());
    }
    case ast::WherePredicateKind::Region: {
      std::string out = pprust::lifetime_to_string(predicate.lifetime);
      for (size_t i = 0; i < predicate.region_bounds.size(); ++i) {
        out += i == 0 ? ": " : " + ";
        out += pprust::lifetime_to_string(predicate.region_bounds[i]);
      }
      return some(doc::lit(std::move(out)));
    }
    case ast::WherePredicateKind::Eq: {
      std::string ty_str = pprust::ty_to_string(*predicate.ty);
      // 3 = " = ".len()
      size_t used_width = 3 + str_width(ty_str);
      auto budget = checked_sub(width, used_width);
      if (!budget) return {};

      auto path_str = rewrite(predicate.path, context, *budget, offset + used_width);
      if (!path_str) return {};
      return some(path_str->concat(doc::lit(" = " + ty_str)));
    }
  }
  return {};
}

optional<doc> rewrite(const ast::LifetimeDef &def, const RewriteContext &, size_t, size_t) {
  return some(doc::lit(pprust::lifetime_def_to_string(def)));
}

optional<doc> rewrite(const ast::TyParamBound &bound, const RewriteContext &context, size_t width,
                      size_t offset) {
  if (bound.kind == ast::TyParamBoundKind::Region) {
    return some(doc::lit(pprust::lifetime_to_string(bound.lifetime)));
  }

  switch (bound.modifier) {
    case ast::TraitBoundModifier::None:
      return rewrite(bound.trait, context, width, offset);
    case ast::TraitBoundModifier::Maybe: {
      // 1 = "?".len()
      auto budget = checked_sub(width, 1);
      if (!budget) return {};
      auto trait = rewrite(bound.trait, context, *budget, offset + 1);
      if (!trait) return {};
      return some(doc::lit("?").concat(*trait));
    }
  }
  return {};
}

optional<doc> rewrite(const ast::TyParam &param, const RewriteContext &context, size_t width,
                      size_t offset) {
  doc_builder result;
  result.append(param.ident);

  if (!param.bounds.empty()) {
    result.append(": ");
    auto bounds = rewrite_bounds(param.bounds, context, width, offset);
    if (!bounds) return {};
    result.append(*bounds);
  }

  if (param.default_) {
    result.append(" = ");
    result.append(pprust::ty_to_string(*param.default_));
  }

  return some(std::move(result).build());
}

optional<doc> rewrite(const ast::PolyTraitRef &poly, const RewriteContext &context, size_t width,
                      size_t offset) {
  if (poly.bound_lifetimes.empty()) {
    return rewrite(poly.trait_ref.path, context, width, offset);
  }

  auto lifetime_str = rewrite_binders(poly.bound_lifetimes, context, width, offset);
  if (!lifetime_str) return {};

  // 6 = "for<> ".len()
  size_t extra = str_width(*lifetime_str) + 6;
  auto max_path_width = checked_sub(width, extra);
  if (!max_path_width) return {};

  auto path_str = rewrite(poly.trait_ref.path, context, *max_path_width, offset + extra);
  if (!path_str) return {};

  return some(doc::lit("for<" + *lifetime_str + "> ").concat(*path_str));
}

}  // namespace tyfmt
