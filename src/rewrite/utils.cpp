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

#include "utils.h"

#include <tyfmt/tracing.h>

#include <sstream>

namespace tyfmt {

optional<BytePos> span_after(Span span, const std::string &needle, const SourceMap &codemap) {
  auto pos = codemap.span_after(span, needle);
  if (!pos) {
    std::stringstream where;
    where << codemap.location(span);
    log::warning("expected `%s` in source", needle.c_str()).with("location", where.str())();
  }
  return pos;
}

const char *get_path_separator(const SourceMap &codemap, BytePos path_start,
                               BytePos segment_start) {
  auto snippet = codemap.span_to_snippet(mk_sp(path_start, segment_start));
  if (!snippet) return "";

  for (auto it = snippet->rbegin(); it != snippet->rend(); ++it) {
    char c = *it;
    if (c == ':') {
      return "::";
    } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '<') {
      continue;
    } else {
      return "";
    }
  }

  return "";
}

}  // namespace tyfmt
