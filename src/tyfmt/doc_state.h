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

#include <utf8proc.h>

#include <algorithm>
#include <cstddef>
#include <string>

namespace tyfmt {

// Folds `State::inject` over every codepoint of `str`. Bytes that are not valid
// utf8 are injected one at a time as single column codepoints so that a source
// buffer with stray bytes still measures sensibly.
template <class State>
State from_string(const std::string& str) {
  State out = State::identity();

  const utf8proc_uint8_t* iter = reinterpret_cast<const utf8proc_uint8_t*>(str.c_str());
  const utf8proc_uint8_t* iter_end = iter + str.size();
  while (iter < iter_end) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t size = utf8proc_iterate(iter, iter_end - iter, &codepoint);

    if (size <= 0 || codepoint < 0) {
      out = out + State::inject(1, '?');
      iter += 1;
      continue;
    }

    iter += size;
    out = out + State::inject(size, codepoint);
  }
  return out;
}

inline size_t codepoint_width(utf8proc_int32_t codepoint) {
  // Tabs and other control characters report a width of zero from utf8proc.
  // Source text only ever carries them as whitespace so count them as one column.
  int width = utf8proc_charwidth(codepoint);
  return width > 0 ? static_cast<size_t>(width) : 1;
}

struct byte_count_state {
  size_t count = 0;

  byte_count_state() = default;
  byte_count_state(size_t count) : count(count) {}

  byte_count_state operator+(byte_count_state other) const {
    return byte_count_state{count + other.count};
  }

  bool operator==(const byte_count_state& other) const { return count == other.count; }

  static byte_count_state identity() { return byte_count_state{}; }

  static byte_count_state inject(size_t size, utf8proc_int32_t codepoint) {
    return byte_count_state{size};
  }
};

struct newline_count_state {
  size_t count = 0;

  newline_count_state() = default;
  newline_count_state(size_t count) : count(count) {}

  newline_count_state operator+(newline_count_state other) const {
    return newline_count_state{count + other.count};
  }

  bool operator==(const newline_count_state& other) const { return count == other.count; }

  static newline_count_state identity() { return newline_count_state{}; }

  static newline_count_state inject(size_t size, utf8proc_int32_t codepoint) {
    return newline_count_state{codepoint == '\n'};
  }
};

class first_width_state {
 private:
  first_width_state(bool wrapped, size_t width) : wrapped(wrapped), width(width) {}

  bool wrapped = false;

 public:
  size_t width = 0;

  first_width_state() = default;

  first_width_state operator+(first_width_state other) const {
    if (wrapped) {
      return *this;
    }
    return first_width_state{other.wrapped, width + other.width};
  }

  bool operator==(const first_width_state& other) const {
    return wrapped == other.wrapped && width == other.width;
  }

  static first_width_state identity() { return first_width_state{}; }

  static first_width_state inject(size_t size, utf8proc_int32_t codepoint) {
    if (codepoint == '\n') return first_width_state{true, 0};
    return first_width_state{false, codepoint_width(codepoint)};
  }
};

class last_width_state {
 private:
  last_width_state(bool wrapped, size_t width) : wrapped(wrapped), width(width) {}

  bool wrapped = false;

 public:
  size_t width = 0;

  last_width_state() = default;

  last_width_state operator+(last_width_state other) const {
    if (other.wrapped) {
      return other;
    }
    return last_width_state{wrapped, width + other.width};
  }

  bool operator==(const last_width_state& other) const {
    return wrapped == other.wrapped && width == other.width;
  }

  static last_width_state identity() { return last_width_state{}; }

  static last_width_state inject(size_t size, utf8proc_int32_t codepoint) {
    if (codepoint == '\n') return last_width_state{true, 0};
    return last_width_state{false, codepoint_width(codepoint)};
  }
};

// Geometry of a piece of text that can be combined in O(1) when two pieces are
// concatenated. The widest line is either the widest line of one side or the
// line formed by joining the last line of the left side with the first line of
// the right side.
class doc_state {
 private:
  doc_state(byte_count_state byte_count, newline_count_state newline_count,
            first_width_state first_width, last_width_state last_width, size_t max_width)
      : byte_count_(byte_count),
        newline_count_(newline_count),
        first_width_(first_width),
        last_width_(last_width),
        max_width_(max_width) {}

  byte_count_state byte_count_;
  newline_count_state newline_count_;

  // Visible width of the first line
  first_width_state first_width_;

  // Visible width of the last line
  last_width_state last_width_;

  // Visible width of the widest line
  size_t max_width_ = 0;

 public:
  doc_state() = default;

  doc_state operator+(doc_state other) const {
    size_t joined = last_width_.width + other.first_width_.width;
    return doc_state{byte_count_ + other.byte_count_, newline_count_ + other.newline_count_,
                     first_width_ + other.first_width_, last_width_ + other.last_width_,
                     std::max({max_width_, other.max_width_, joined})};
  }

  bool operator==(const doc_state& other) const {
    return byte_count_ == other.byte_count_ && newline_count_ == other.newline_count_ &&
           first_width_ == other.first_width_ && last_width_ == other.last_width_ &&
           max_width_ == other.max_width_;
  }

  const doc_state* operator->() const { return this; }

  static doc_state identity() {
    return doc_state{byte_count_state::identity(), newline_count_state::identity(),
                     first_width_state::identity(), last_width_state::identity(), 0};
  }

  static doc_state inject(size_t size, utf8proc_int32_t codepoint) {
    size_t width = codepoint == '\n' ? 0 : codepoint_width(codepoint);
    return doc_state{byte_count_state::inject(size, codepoint),
                     newline_count_state::inject(size, codepoint),
                     first_width_state::inject(size, codepoint),
                     last_width_state::inject(size, codepoint), width};
  }

  size_t byte_count() const { return byte_count_.count; }
  size_t newline_count() const { return newline_count_.count; }
  size_t first_width() const { return first_width_.width; }
  size_t last_width() const { return last_width_.width; }
  size_t max_width() const { return max_width_; }
  bool has_newline() const { return newline_count() > 0; }
  size_t height() const { return newline_count() + 1; }
};

// Visible width of the widest line of `str`.
inline size_t str_width(const std::string& str) { return from_string<doc_state>(str).max_width(); }

}  // namespace tyfmt
