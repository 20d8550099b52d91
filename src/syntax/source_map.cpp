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

#include "source_map.h"

#include <tyfmt/doc_state.h>

#include <algorithm>

namespace tyfmt {

SourceMap::SourceMap(std::string filename, std::string content)
    : fname(std::move(filename)), text(std::move(content)) {
  newlines.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') newlines.push_back(i + 1);
  }
}

optional<std::string> SourceMap::span_to_snippet(Span span) const {
  if (span.lo > span.hi || span.hi > text.size()) {
    return {};
  }
  return some(text.substr(span.lo, span.hi - span.lo));
}

optional<BytePos> SourceMap::first_occurrence(Span span, const std::string &needle) const {
  auto snippet = span_to_snippet(span);
  if (!snippet) return {};

  size_t index = snippet->find(needle);
  if (index == std::string::npos) return {};

  return some(static_cast<BytePos>(span.lo + index));
}

optional<BytePos> SourceMap::span_after(Span span, const std::string &needle) const {
  auto pos = first_occurrence(span, needle);
  if (!pos) return {};
  return some(static_cast<BytePos>(*pos + needle.size()));
}

Coordinates SourceMap::coordinates(BytePos pos) const {
  size_t clamped = std::min<size_t>(pos, text.size());
  auto it = std::upper_bound(newlines.begin(), newlines.end(), clamped);
  size_t row = it - newlines.begin();
  size_t line_start = newlines[row - 1];
  // Columns count visible characters, not bytes
  size_t column = str_width(text.substr(line_start, clamped - line_start)) + 1;
  return Coordinates(static_cast<int>(row), static_cast<int>(column));
}

Location SourceMap::location(Span span) const {
  // hi is exclusive, the location names the last included byte
  BytePos last = span.hi > span.lo ? span.hi - 1 : span.hi;
  return Location(fname, coordinates(span.lo), coordinates(last));
}

}  // namespace tyfmt
