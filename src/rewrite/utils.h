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

#include <string>

#include "syntax/source_map.h"
#include "syntax/span.h"

namespace tyfmt {

// Columns the text already on the last line of `buffer` takes up beyond
// `offset`. Continuation lines carry their indentation in absolute columns, so
// once the buffer spans several lines `offset` is already part of the last
// line's width.
inline size_t extra_offset(const doc_builder &buffer, size_t offset) {
  if (!buffer.has_newline()) return buffer.last_width();
  return buffer.last_width() > offset ? buffer.last_width() - offset : 0;
}

inline size_t extra_offset(const doc &text, size_t offset) {
  if (!text.has_newline()) return text.last_width();
  return text.last_width() > offset ? text.last_width() - offset : 0;
}

inline std::string make_indent(size_t width) { return std::string(width, ' '); }

// Position one past the first `needle` inside `span`, logging a warning that
// points at the span when the source does not contain it there.
optional<BytePos> span_after(Span span, const std::string &needle, const SourceMap &codemap);

// Generic arguments are written `Foo<A>` in type position but `Foo::<A>` in
// expression position and the tree does not record which one was used. This
// scans the raw text between `path_start` and `segment_start` (which sits just
// after the `<`) backwards, skipping whitespace and `<`: a `:` means `::`,
// anything else means no separator.
//
// A comment holding `<` or `:` in the scanned text can mislead this.
const char *get_path_separator(const SourceMap &codemap, BytePos path_start,
                               BytePos segment_start);

}  // namespace tyfmt
