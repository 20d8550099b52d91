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

#include <cstdint>

namespace tyfmt {

// Byte offset into a source buffer.
using BytePos = uint32_t;

// Half-open byte range [lo, hi) of a source buffer.
struct Span {
  BytePos lo = 0;
  BytePos hi = 0;

  Span() = default;
  Span(BytePos lo_, BytePos hi_) : lo(lo_), hi(hi_) {}

  bool operator==(const Span& other) const { return lo == other.lo && hi == other.hi; }
  bool operator!=(const Span& other) const { return !(*this == other); }
};

inline Span mk_sp(BytePos lo, BytePos hi) { return Span(lo, hi); }

}  // namespace tyfmt
