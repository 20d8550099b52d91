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

#include "comment.h"

#include <tyfmt/doc_state.h>

#include <sstream>
#include <vector>

#include "config.h"
#include "utils.h"

namespace tyfmt {

enum class CharClass {
  Code,
  LineComment,
  BlockComment,
  String,
};

// Classifies every byte of `text`. Comment and string delimiters belong to
// the comment or string they open or close.
static std::vector<CharClass> classify(const std::string &text) {
  std::vector<CharClass> out(text.size(), CharClass::Code);
  CharClass state = CharClass::Code;
  size_t depth = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    char n = i + 1 < text.size() ? text[i + 1] : '\0';

    switch (state) {
      case CharClass::Code:
        if (c == '/' && n == '/') {
          state = CharClass::LineComment;
        } else if (c == '/' && n == '*') {
          state = CharClass::BlockComment;
          depth = 1;
          out[i] = out[i + 1] = state;
          ++i;
          continue;
        } else if (c == '"') {
          state = CharClass::String;
        }
        out[i] = state;
        break;
      case CharClass::LineComment:
        out[i] = state;
        if (c == '\n') state = CharClass::Code;
        break;
      case CharClass::BlockComment:
        out[i] = state;
        if (c == '/' && n == '*') {
          out[++i] = state;
          ++depth;
        } else if (c == '*' && n == '/') {
          out[++i] = state;
          if (--depth == 0) state = CharClass::Code;
        }
        break;
      case CharClass::String:
        out[i] = state;
        if (c == '\\' && n != '\0') {
          out[++i] = state;
        } else if (c == '"') {
          state = CharClass::Code;
        }
        break;
    }
  }

  return out;
}

optional<size_t> find_uncommented(const std::string &text, const std::string &pattern) {
  if (pattern.empty()) return some<size_t>(0);

  std::vector<CharClass> classes = classify(text);
  for (size_t i = 0; i + pattern.size() <= text.size(); ++i) {
    if (text.compare(i, pattern.size(), pattern) != 0) continue;

    bool code = true;
    for (size_t j = i; j < i + pattern.size(); ++j) {
      if (classes[j] != CharClass::Code) code = false;
    }
    if (code) return some(i);
  }

  return {};
}

optional<size_t> find_comment_end(const std::string &text) {
  if (text.compare(0, 2, "//") == 0) {
    size_t newline = text.find('\n');
    if (newline == std::string::npos) return {};
    return some(newline + 1);
  }

  size_t close = text.find("*/");
  if (close == std::string::npos) return {};
  return some(close + 2);
}

bool contains_comment(const std::string &text) {
  for (CharClass c : classify(text)) {
    if (c == CharClass::LineComment || c == CharClass::BlockComment) return true;
  }
  return false;
}

static std::string trim(const std::string &str) {
  const char *ws = " \t\r\n";
  size_t start = str.find_first_not_of(ws);
  if (start == std::string::npos) return "";
  size_t end = str.find_last_not_of(ws);
  return str.substr(start, end - start + 1);
}

static std::string trim_left(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\r\n");
  return start == std::string::npos ? "" : str.substr(start);
}

static std::string trim_right(const std::string &str) {
  size_t end = str.find_last_not_of(" \t\r\n");
  return end == std::string::npos ? "" : str.substr(0, end + 1);
}

static bool starts_with(const std::string &str, const char *prefix) {
  return str.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

static bool ends_with(const std::string &str, const char *suffix) {
  size_t len = std::char_traits<char>::length(suffix);
  return str.size() >= len && str.compare(str.size() - len, len, suffix) == 0;
}

std::string left_trim_comment_line(const std::string &line) {
  if (starts_with(line, "/* ") || starts_with(line, "// ")) return line.substr(3);
  if (starts_with(line, "/*") || starts_with(line, "* ") || starts_with(line, "//"))
    return line.substr(2);
  if (starts_with(line, "*")) return line.substr(1);
  return line;
}

// Greedy word wrap of one comment line. Words wider than `width` get a line
// of their own.
static std::vector<std::string> wrap_words(const std::string &line, size_t width) {
  std::vector<std::string> out;
  std::stringstream words(line);
  std::string word;
  std::string current;

  while (words >> word) {
    if (current.empty()) {
      current = word;
    } else if (str_width(current) + 1 + str_width(word) <= width) {
      current += " " + word;
    } else {
      out.push_back(current);
      current = word;
    }
  }
  if (!current.empty()) out.push_back(current);

  return out;
}

std::string rewrite_comment(const std::string &orig, bool block_style, size_t width,
                            size_t offset, const Config &config) {
  std::string s = trim(orig);
  if (!config.normalize_comments) return s;

  const char *opener = block_style ? "/* " : "// ";
  const char *closer = block_style ? " */" : "";
  const char *line_start = block_style ? " * " : "// ";

  size_t max_chars = width > 6 ? width - 6 : 1;
  if (!block_style) max_chars = width > 3 ? width - 3 : 1;

  std::vector<std::string> lines;
  std::stringstream in(s);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  size_t line_breaks = lines.empty() ? 0 : lines.size() - 1;

  std::string indent = make_indent(offset);
  std::string acc = opener;
  bool first = true;

  auto push_line = [&](const std::string &text) {
    if (!first) {
      acc += "\n" + indent + line_start;
    }
    first = false;
    if (text.empty()) {
      // An empty line keeps no trailing space after the marker
      acc.pop_back();
    }
    acc += text;
  };

  for (size_t i = 0; i < lines.size(); ++i) {
    std::string current = trim(lines[i]);
    // The old closer is replaced by ours
    if (i == line_breaks && ends_with(current, "*/") && !starts_with(current, "//")) {
      current = trim_right(current.substr(0, current.size() - 2));
    }
    current = left_trim_comment_line(current);
    if (line_breaks == 0) current = trim_left(current);
    current = trim_right(current);

    if (config.wrap_comments && str_width(current) > max_chars) {
      for (const auto &piece : wrap_words(current, max_chars)) push_line(piece);
    } else {
      push_line(current);
    }
  }
  if (lines.empty()) push_line("");

  acc += closer;
  return acc;
}

}  // namespace tyfmt
