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

#include <tyfmt/result.h>

#include <cstddef>
#include <ostream>
#include <string>

#include "lists.h"

namespace tyfmt {

// How far a where clause (or its predicates) is indented.
enum class BlockIndentStyle {
  // Same level as the parent
  Inherit,
  // One tab stop deeper than the parent
  Tabbed,
  // Aligned with the text following `where `
  Visual,
};

struct Config {
  size_t max_width = 100;
  size_t ideal_width = 80;
  size_t leeway = 5;
  size_t tab_spaces = 4;
  BlockIndentStyle where_indent = BlockIndentStyle::Tabbed;
  BlockIndentStyle where_pred_indent = BlockIndentStyle::Visual;
  ListTactic where_layout = ListTactic::Vertical;
  bool normalize_comments = true;
  bool wrap_comments = true;
};

std::ostream &operator<<(std::ostream &os, const Config &config);

enum class ConfigErrorKind {
  UnknownKey,
  InvalidValue,
  Malformed,
  BadFile,
};

struct ConfigError {
  ConfigErrorKind kind;
  std::string message;
};

namespace config {

// Reads a JSON object such as `{"max_width": 80, "where_layout": "Mixed"}`.
// Sizes are unsigned integers, booleans are `true`/`false` and styles and
// tactics are given by name. Keys left unmentioned keep their default.
result<Config, ConfigError> parse(const std::string &text);

// `parse` applied to the contents of the file at `path`, usually `tyfmt.json`.
result<Config, ConfigError> load(const std::string &path);

}  // namespace config
}  // namespace tyfmt
