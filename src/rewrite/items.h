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

namespace tyfmt {

// Source extent of a type parameter including its bounds and default.
// `param.span` only covers the identifier.
Span span_for_ty_param(const ast::TyParam &param);

// `<'a, T: Clone>` starting at column `offset`. `span` covers the angle
// brackets in the source and is used to keep comments between parameters.
// Empty when there are no parameters.
optional<doc> rewrite_generics(const RewriteContext &context, const ast::Generics &generics,
                               size_t offset, Span span);

// A newline, the clause indentation and `where ` followed by the predicates.
// `indent` is the column of the item the clause belongs to and `span_end`
// bounds the source text searched after the last predicate. Empty when there
// are no predicates.
optional<doc> rewrite_where_clause(const RewriteContext &context,
                                   const ast::WhereClause &where_clause, size_t indent,
                                   BytePos span_end);

}  // namespace tyfmt
