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

#include <tyfmt/doc.h>
#include <tyfmt/optional.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "rewrite/config.h"
#include "rewrite/context.h"
#include "syntax/ast.h"
#include "syntax/source_map.h"

// Hands out the spans of successive tokens of a source text so test trees
// can be built with real offsets. Every search starts after the previous
// token.
class SpanCursor {
 private:
  const std::string &text;
  size_t pos = 0;

 public:
  explicit SpanCursor(const std::string &text_) : text(text_) {}

  tyfmt::Span next(const std::string &token) {
    size_t at = text.find(token, pos);
    if (at == std::string::npos) at = text.size();
    pos = std::min(at + token.size(), text.size());
    return tyfmt::mk_sp(static_cast<tyfmt::BytePos>(at), static_cast<tyfmt::BytePos>(pos));
  }

  tyfmt::BytePos position() const { return static_cast<tyfmt::BytePos>(pos); }
};

// A source buffer with a context to render against it.
struct Fixture {
  std::string source;
  tyfmt::SourceMap codemap;
  tyfmt::Config config;
  tyfmt::RewriteContext context;

  explicit Fixture(const std::string &source_, tyfmt::Config config_ = tyfmt::Config())
      : source(source_), codemap("test.rs", source_), config(config_), context(codemap, config) {}

  SpanCursor cursor() const { return SpanCursor(source); }
};

// The rendered text, or `<none>` when rendering failed.
inline std::string show(const tyfmt::optional<tyfmt::doc> &d) {
  return d ? d->as_string() : "<none>";
}

// `name` as a single segment path type.
inline tyfmt::ast::TyPtr simple_ty(const std::string &name, tyfmt::Span span) {
  std::vector<tyfmt::ast::PathSegment> segments;
  segments.push_back(tyfmt::ast::segment(name));
  return tyfmt::ast::ty_path(tyfmt::ast::path(span, std::move(segments)), span);
}

inline tyfmt::ast::Path simple_path(const std::string &name, tyfmt::Span span) {
  std::vector<tyfmt::ast::PathSegment> segments;
  segments.push_back(tyfmt::ast::segment(name));
  return tyfmt::ast::path(span, std::move(segments));
}

// A trait bound naming a single segment path.
inline tyfmt::ast::TyParamBound simple_bound(
    const std::string &name, tyfmt::Span span,
    tyfmt::ast::TraitBoundModifier modifier = tyfmt::ast::TraitBoundModifier::None) {
  return tyfmt::ast::trait_bound(tyfmt::ast::poly_trait_ref({}, simple_path(name, span), span),
                                 modifier);
}

// Moves the arguments into a vector; initializer lists cannot hold move-only
// values.
template <class T, class... Rest>
std::vector<T> move_vec(T first, Rest... rest) {
  std::vector<T> out;
  out.push_back(std::move(first));
  int expand[] = {0, (out.push_back(std::move(rest)), 0)...};
  (void)expand;
  return out;
}
