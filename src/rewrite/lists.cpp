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

#include "lists.h"

#include <tyfmt/doc_state.h>
#include <tyfmt/tracing.h>

#include <algorithm>

#include "config.h"
#include "utils.h"

namespace tyfmt {

const char *list_tactic_name(ListTactic tactic) {
  switch (tactic) {
    case ListTactic::Vertical:
      return "Vertical";
    case ListTactic::Horizontal:
      return "Horizontal";
    case ListTactic::HorizontalVertical:
      return "HorizontalVertical";
    case ListTactic::Mixed:
      return "Mixed";
  }
  return "?";
}

static bool contains_newline(const optional<std::string> &comment) {
  return comment && comment->find('\n') != std::string::npos;
}

bool ListItem::is_multiline() const {
  return item.find('\n') != std::string::npos || contains_newline(pre_comment) ||
         contains_newline(post_comment);
}

bool ListItem::has_line_pre_comment() const {
  return pre_comment && pre_comment->compare(0, 2, "//") == 0;
}

namespace lists_detail {

std::string trim(const std::string &str) {
  const char *ws = " \t\r\n";
  size_t start = str.find_first_not_of(ws);
  if (start == std::string::npos) return "";
  size_t end = str.find_last_not_of(ws);
  return str.substr(start, end - start + 1);
}

size_t post_comment_end(const std::string &post_snippet, const std::string &separator,
                        const std::string &terminator, bool last) {
  if (last) {
    return find_uncommented(post_snippet, terminator).value_or(post_snippet.size());
  }

  size_t separator_index =
      find_uncommented(post_snippet, separator).value_or(post_snippet.size());
  size_t block_open = post_snippet.find("/*");
  size_t newline = post_snippet.find('\n');
  size_t after_separator = std::min(separator_index + separator.size(), post_snippet.size());

  if (block_open != std::string::npos && newline == std::string::npos) {
    // Separator before the comment with the next item on the same line: the
    // comment belongs to the next item.
    if (block_open > separator_index) return after_separator;
    // Block comment before the separator
    size_t comment_end = find_comment_end(post_snippet.substr(block_open))
                             .value_or(post_snippet.size() - block_open);
    return std::max(block_open + comment_end, after_separator);
  }

  if (block_open != std::string::npos && block_open < newline) {
    // Block comment either before or after the separator
    size_t comment_end = find_comment_end(post_snippet.substr(block_open))
                             .value_or(post_snippet.size() - block_open);
    return std::max(block_open + comment_end, after_separator);
  }

  if (newline != std::string::npos) {
    // A line comment ends with the line
    return std::max(newline + 1, after_separator);
  }

  return post_snippet.size();
}

optional<std::string> post_comment(const std::string &post_snippet, size_t comment_end,
                                   const std::string &separator) {
  std::string snippet = trim(post_snippet.substr(0, comment_end));

  if (!separator.empty() && snippet.compare(0, separator.size(), separator) == 0) {
    snippet = trim(snippet.substr(separator.size()));
  } else if (snippet.size() >= separator.size() && !separator.empty() &&
             snippet.compare(snippet.size() - separator.size(), separator.size(), separator) ==
                 0) {
    snippet = trim(snippet.substr(0, snippet.size() - separator.size()));
  }

  if (snippet.empty()) return {};
  return some(snippet);
}

}  // namespace lists_detail

// Inline comments are written as ` /* ... */`
static size_t comment_len(const optional<std::string> &comment) {
  if (!comment) return 0;
  size_t text_len = str_width(lists_detail::trim(*comment));
  return text_len > 0 ? text_len + 6 : 0;
}

static size_t total_item_width(const ListItem &item) {
  return comment_len(item.pre_comment) + comment_len(item.post_comment) + str_width(item.item);
}

static bool needs_trailing_separator(SeparatorTactic separator_tactic, ListTactic list_tactic) {
  switch (separator_tactic) {
    case SeparatorTactic::Always:
      return true;
    case SeparatorTactic::Vertical:
      return list_tactic == ListTactic::Vertical;
    case SeparatorTactic::Never:
      return false;
  }
  return false;
}

doc write_list(const std::vector<ListItem> &items, const ListFormatting &formatting) {
  if (items.empty()) return doc::empty();

  static const Config default_config;
  const Config &config = formatting.config ? *formatting.config : default_config;

  ListTactic tactic = formatting.tactic;

  // Overestimates when the trailing separator is dropped later
  size_t sep_count =
      formatting.trailing_separator == SeparatorTactic::Always ? items.size() : items.size() - 1;
  size_t sep_len = str_width(formatting.separator);
  size_t total_sep_len = (sep_len + 1) * sep_count;

  size_t total_width = 0;
  for (const auto &item : items) total_width += total_item_width(item);
  bool fits_single = total_width + total_sep_len <= formatting.h_width;

  if (tactic == ListTactic::HorizontalVertical) {
    bool multiline = std::any_of(items.begin(), items.end(),
                                 [](const ListItem &item) { return item.is_multiline(); });
    tactic = fits_single && !multiline ? ListTactic::Horizontal : ListTactic::Vertical;
  }

  // Horizontal never breaks after v_width columns
  if (tactic == ListTactic::Mixed && fits_single) {
    tactic = ListTactic::Horizontal;
  }

  // A line comment has to be followed by a line break
  if (std::any_of(items.begin(), items.end(),
                  [](const ListItem &item) { return item.has_line_pre_comment(); })) {
    tactic = ListTactic::Vertical;
  }

  log::debug("write_list: %zu items, %zu columns in %zu, %s", items.size(),
             total_width + total_sep_len, formatting.h_width, list_tactic_name(tactic))
      .with("tactic", list_tactic_name(tactic))();

  bool trailing_separator = needs_trailing_separator(formatting.trailing_separator, tactic);

  doc_builder result;
  size_t line_len = 0;
  std::string indent_str = make_indent(formatting.indent);

  for (size_t i = 0; i < items.size(); ++i) {
    const ListItem &item = items[i];
    bool first = i == 0;
    bool last = i == items.size() - 1;
    bool separate = !last || trailing_separator;
    size_t item_sep_len = separate ? sep_len : 0;
    size_t item_width = str_width(item.item) + item_sep_len;

    switch (tactic) {
      case ListTactic::Horizontal:
        if (!first) result.append(" ");
        break;
      case ListTactic::Vertical:
        if (!first) result.append("\n" + indent_str);
        break;
      case ListTactic::Mixed: {
        size_t width = total_item_width(item) + item_sep_len;
        if (line_len > 0 && line_len + width > formatting.v_width) {
          result.append("\n" + indent_str);
          line_len = 0;
        }
        if (line_len > 0) {
          result.append(" ");
          line_len += 1;
        }
        line_len += width;
        break;
      }
      case ListTactic::HorizontalVertical:
        break;
    }

    if (item.pre_comment) {
      // Block style unless each comment gets its own line; the width only
      // matters when it does.
      result.append(rewrite_comment(*item.pre_comment, tactic != ListTactic::Vertical,
                                    formatting.v_width, formatting.indent, config));
      if (tactic == ListTactic::Vertical) {
        result.append("\n" + indent_str);
      } else {
        result.append(" ");
      }
    }

    result.append(item.item);

    if (tactic != ListTactic::Vertical && item.post_comment) {
      result.append(" ");
      result.append(rewrite_comment(*item.post_comment, true, formatting.v_width, 0, config));
    }

    if (separate) {
      result.append(formatting.separator);
    }

    if (tactic == ListTactic::Vertical && item.post_comment) {
      // 1 = space between item and comment
      size_t width = formatting.v_width > item_width + 1 ? formatting.v_width - item_width - 1 : 1;
      size_t offset = formatting.indent + item_width + 1;
      std::string comment = lists_detail::trim(*item.post_comment);
      // Block style for the last item and for comments that cannot be a
      // single line comment
      bool block_style = (formatting.ends_with_newline && last) ||
                         comment.find('\n') != std::string::npos || str_width(comment) > width;

      result.append(" ");
      result.append(rewrite_comment(comment, block_style, width, offset, config));
    }
  }

  return std::move(result).build();
}

}  // namespace tyfmt
