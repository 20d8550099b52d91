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

#include "items.h"

#include <string>
#include <vector>

#include "lists.h"
#include "types.h"
#include "utils.h"

namespace tyfmt {

namespace {

// A rendered list entry and the source it came from.
struct RenderedItem {
  Span span;
  std::string text;
};

}  // namespace

static std::vector<ListItem> itemize_rendered(const SourceMap &codemap,
                                              const std::vector<RenderedItem> &rendered,
                                              const std::string &terminator,
                                              BytePos prev_span_end, BytePos next_span_start) {
  return itemize_list(
      codemap, rendered.begin(), rendered.end(), ",", terminator,
      [](const RenderedItem &item) { return item.span.lo; },
      [](const RenderedItem &item) { return item.span.hi; },
      [](const RenderedItem &item) { return item.text; }, prev_span_end, next_span_start);
}

Span span_for_ty_param(const ast::TyParam &param) {
  BytePos lo = param.span.lo;
  if (param.default_) return mk_sp(lo, param.default_->span.hi);
  if (param.bounds.empty()) return param.span;
  return mk_sp(lo, param.bounds.back().span().hi);
}

static Span span_for_lifetime_def(const ast::LifetimeDef &def) {
  BytePos hi = def.bounds.empty() ? def.lifetime.span.hi : def.bounds.back().span.hi;
  return mk_sp(def.lifetime.span.lo, hi);
}

optional<doc> rewrite_generics(const RewriteContext &context, const ast::Generics &generics,
                               size_t offset, Span span) {
  if (generics.is_empty()) return some(doc::empty());

  // 2 = "<>".len()
  auto h_budget = checked_sub(context.config.max_width, offset + 2);
  if (!h_budget) return {};

  std::vector<RenderedItem> rendered;
  for (const auto &def : generics.lifetimes) {
    auto text = rewrite(def, context, *h_budget, offset);
    if (!text) return {};
    rendered.push_back(RenderedItem{span_for_lifetime_def(def), text->as_string()});
  }
  for (const auto &param : generics.ty_params) {
    auto text = rewrite(param, context, *h_budget, offset);
    if (!text) return {};
    rendered.push_back(RenderedItem{span_for_ty_param(param), text->as_string()});
  }

  auto list_lo = span_after(span, "<", context.codemap);
  if (!list_lo) return {};

  auto items = itemize_rendered(context.codemap, rendered, ">", *list_lo, span.hi);

  // 1 = "<".len()
  ListFormatting fmt{ListTactic::HorizontalVertical,
                     ",",
                     SeparatorTactic::Never,
                     offset + 1,
                     *h_budget,
                     *h_budget,
                     true,
                     &context.config};

  doc_builder out;
  out.append("<");
  out.append(write_list(items, fmt));
  out.append(">");
  return some(std::move(out).build());
}

optional<doc> rewrite_where_clause(const RewriteContext &context,
                                   const ast::WhereClause &where_clause, size_t indent,
                                   BytePos span_end) {
  if (where_clause.predicates.empty()) return some(doc::empty());

  const Config &config = context.config;

  size_t extra_indent = config.where_indent == BlockIndentStyle::Inherit ? 0 : config.tab_spaces;

  size_t offset = indent + extra_indent;
  switch (config.where_pred_indent) {
    case BlockIndentStyle::Inherit:
      break;
    case BlockIndentStyle::Tabbed:
      offset += config.tab_spaces;
      break;
    case BlockIndentStyle::Visual:
      // 6 = "where ".len()
      offset += 6;
      break;
  }

  auto budget = checked_sub(config.ideal_width + config.leeway, offset);
  if (!budget) return {};

  std::vector<RenderedItem> rendered;
  for (const auto &predicate : where_clause.predicates) {
    auto text = rewrite(predicate, context, *budget, offset);
    if (!text) return {};
    rendered.push_back(RenderedItem{predicate.span, text->as_string()});
  }

  BytePos span_start = where_clause.predicates.front().span.lo;
  auto items = itemize_rendered(context.codemap, rendered, "{", span_start, span_end);

  ListFormatting fmt{config.where_layout,
                     ",",
                     SeparatorTactic::Never,
                     offset,
                     *budget,
                     *budget,
                     true,
                     &config};

  doc_builder out;
  out.append("\n" + make_indent(indent + extra_indent) + "where ");
  out.append(write_list(items, fmt));
  return some(std::move(out).build());
}

}  // namespace tyfmt
