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

namespace tyfmt {

struct Config;

// Index of the first occurrence of `pattern` in `text` that is not inside a
// `//` comment, a `/* */` comment or a string literal.
optional<size_t> find_uncommented(const std::string &text, const std::string &pattern);

// One past the end of the comment `text` starts with. Line comments end after
// their newline.
optional<size_t> find_comment_end(const std::string &text);

// True if `text` holds a comment outside of string literals.
bool contains_comment(const std::string &text);

// Drops the comment marker (and one following space) from a comment line.
std::string left_trim_comment_line(const std::string &line);

// Rewrites the comment `orig` as `// ...` lines or as one `/* ... */` block
// when `block_style` is set. Continuation lines are indented to `offset`.
// Lines longer than `width` are wrapped at word boundaries when the
// configuration asks for it. Without `normalize_comments` the trimmed comment
// is returned as written.
std::string rewrite_comment(const std::string &orig, bool block_style, size_t width,
                            size_t offset, const Config &config);

}  // namespace tyfmt
