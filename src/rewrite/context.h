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

#include <cstddef>

#include "config.h"
#include "syntax/source_map.h"

namespace tyfmt {

// Everything a renderer may consult besides the node and its budget. The
// source map and configuration are borrowed and must outlive the context.
struct RewriteContext {
  const SourceMap &codemap;
  const Config &config;
  // Indentation of the enclosing block in columns
  size_t block_indent;

  RewriteContext(const SourceMap &codemap_, const Config &config_, size_t block_indent_ = 0)
      : codemap(codemap_), config(config_), block_indent(block_indent_) {}
};

}  // namespace tyfmt
