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

#include "context.h"
#include "syntax/ast.h"
#include "syntax/span.h"

// Width-aware rendering of paths, generic arguments, bounds and where clause
// predicates.
//
// Every renderer takes the columns it may use (`width`) and the absolute
// column it starts at (`offset`). Lines after the first start at an absolute
// column chosen by the renderer. An empty optional means the node does not
// fit.

namespace tyfmt {

// Renders `path`, qualified by `qself` when it is not null:
// `<Vec<T> as IntoIterator>::Item`.
optional<doc> rewrite_path(const RewriteContext &context, const ast::QSelf *qself,
                           const ast::Path &path, size_t width, size_t offset);

// Renders one segment and its generic arguments. The raw source between
// `span_lo` and `span_hi` (the end of the whole path) is searched for the
// argument list; `span_lo` is moved past the arguments so the next segment
// starts its search after them.
optional<doc> rewrite_segment(const ast::PathSegment &segment, BytePos &span_lo, BytePos span_hi,
                              const RewriteContext &context, size_t width, size_t offset);

optional<doc> rewrite(const ast::Path &path, const RewriteContext &context, size_t width,
                      size_t offset);
optional<doc> rewrite(const ast::WherePredicate &predicate, const RewriteContext &context,
                      size_t width, size_t offset);
optional<doc> rewrite(const ast::LifetimeDef &def, const RewriteContext &context, size_t width,
                      size_t offset);
optional<doc> rewrite(const ast::TyParamBound &bound, const RewriteContext &context, size_t width,
                      size_t offset);
optional<doc> rewrite(const ast::PolyTraitRef &poly, const RewriteContext &context, size_t width,
                      size_t offset);

// Bounds receive the full width and offset rather than what is left after
// the identifier, so a long parameter may overrun the width.
optional<doc> rewrite(const ast::TyParam &param, const RewriteContext &context, size_t width,
                      size_t offset);

}  // namespace tyfmt
