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
#include <vector>

#include "comment.h"
#include "syntax/source_map.h"
#include "syntax/span.h"

namespace tyfmt {

struct Config;

enum class ListTactic {
  // One item per row.
  Vertical,
  // All items on one row.
  Horizontal,
  // Try Horizontal layout, if that fails then vertical
  HorizontalVertical,
  // Pack as many items as possible per row over (possibly) many rows.
  Mixed,
};

const char *list_tactic_name(ListTactic tactic);

enum class SeparatorTactic {
  Always,
  Never,
  // Only when the list is laid out vertically
  Vertical,
};

struct ListFormatting {
  ListTactic tactic;
  const char *separator;
  SeparatorTactic trailing_separator;
  // Absolute column of every row after the first
  size_t indent;
  // Width of the single row of a horizontal layout
  size_t h_width;
  // Width of every row of a vertical or mixed layout
  size_t v_width;
  bool ends_with_newline;
  // Comment settings; the defaults are used when null
  const Config *config;
};

struct ListItem {
  optional<std::string> pre_comment;
  std::string item;
  optional<std::string> post_comment;

  ListItem(std::string item_) : item(std::move(item_)) {}

  bool is_multiline() const;
  // A `//` comment before the item can only be followed by a line break
  bool has_line_pre_comment() const;
};

// Lays the items out according to `formatting`.
doc write_list(const std::vector<ListItem> &items, const ListFormatting &formatting);

namespace lists_detail {

std::string trim(const std::string &str);

// Where the text following an item stops belonging to it.
size_t post_comment_end(const std::string &post_snippet, const std::string &separator,
                        const std::string &terminator, bool last);

optional<std::string> post_comment(const std::string &post_snippet, size_t comment_end,
                                   const std::string &separator);

}  // namespace lists_detail

// Splits the raw text around each item into the item and the comments
// attached to it. `prev_span_end` is where the text before the first item
// starts (just after the list opener) and `next_span_start` bounds the text
// after the last item, which is scanned up to `terminator`.
//
// The comments between two items are divided at the separator: a comment on
// the same line as an item (or a block comment that straddles the separator)
// belongs to it, anything on later lines belongs to the next item.
template <class Iter, class GetLo, class GetHi, class GetItem>
std::vector<ListItem> itemize_list(const SourceMap &codemap, Iter begin, Iter end,
                                   const std::string &separator, const std::string &terminator,
                                   GetLo get_lo, GetHi get_hi, GetItem get_item,
                                   BytePos prev_span_end, BytePos next_span_start) {
  std::vector<ListItem> out;

  for (Iter it = begin; it != end; ++it) {
    Iter next = it;
    ++next;
    bool last = next == end;

    BytePos lo = get_lo(*it);
    BytePos hi = get_hi(*it);

    ListItem item(get_item(*it));

    auto pre_snippet = codemap.span_to_snippet(mk_sp(prev_span_end, lo));
    std::string trimmed_pre = lists_detail::trim(pre_snippet.value_or(""));
    if (!trimmed_pre.empty()) item.pre_comment = some(trimmed_pre);

    BytePos next_start = last ? next_span_start : get_lo(*next);
    std::string post_snippet = codemap.span_to_snippet(mk_sp(hi, next_start)).value_or("");

    size_t comment_end = lists_detail::post_comment_end(post_snippet, separator, terminator, last);
    item.post_comment = lists_detail::post_comment(post_snippet, comment_end, separator);

    prev_span_end = hi + static_cast<BytePos>(comment_end);
    out.push_back(std::move(item));
  }

  return out;
}

}  // namespace tyfmt
