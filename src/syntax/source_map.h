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

#include <tyfmt/optional.h>

#include <string>
#include <vector>

#include "span.h"
#include "util/location.h"

namespace tyfmt {

// The original text of one source file. Spans recorded in the syntax tree are
// byte offsets into this buffer; the renderers read it back to recover what
// the tree does not keep (punctuation, comments).
class SourceMap {
 public:
  SourceMap(std::string filename, std::string content);

  // copy construction is forbidden
  SourceMap(const SourceMap &) = delete;
  SourceMap &operator=(const SourceMap &) = delete;

  const std::string &filename() const { return fname; }
  const std::string &content() const { return text; }

  // The raw text of `span`. Empty when the span is inverted or runs past the
  // end of the buffer.
  optional<std::string> span_to_snippet(Span span) const;

  // Position of the first `needle` inside `span`.
  optional<BytePos> first_occurrence(Span span, const std::string &needle) const;

  // Position one past the first `needle` inside `span`.
  optional<BytePos> span_after(Span span, const std::string &needle) const;

  Coordinates coordinates(BytePos pos) const;
  Location location(Span span) const;

 private:
  std::string fname;
  std::string text;
  // Byte offset of the first column of every row
  std::vector<size_t> newlines;
};

}  // namespace tyfmt
