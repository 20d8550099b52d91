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

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "doc_state.h"

namespace tyfmt {

class doc_impl_base {
 protected:
  doc_state state_;

  doc_impl_base(doc_state state) : state_(state) {}

 public:
  virtual ~doc_impl_base() = default;

  virtual void write(std::ostream&) const = 0;

  const doc_state& operator*() const { return state_; }
};

class doc_impl_string : public doc_impl_base {
 private:
  std::string str;

 public:
  explicit doc_impl_string(std::string str)
      : doc_impl_base(from_string<doc_state>(str)), str(std::move(str)) {}
  void write(std::ostream& ostream) const override { ostream << str; }
};

class doc_impl_pair : public doc_impl_base {
 private:
  std::shared_ptr<doc_impl_base> left;
  std::shared_ptr<doc_impl_base> right;

 public:
  doc_impl_pair(std::shared_ptr<doc_impl_base> l, std::shared_ptr<doc_impl_base> r)
      : doc_impl_base(**l + **r), left(std::move(l)), right(std::move(r)) {}

  void write(std::ostream& ostream) const override {
    left->write(ostream);
    right->write(ostream);
  }
};

class doc_builder;

// `doc` is rendered output text. Concatenation is O(1) and so is every
// geometry query (first, last and widest line width, newline count), which
// is what the renderers need to account for the columns already consumed on
// the current output line.
//
// Examples:
// ```
// doc d1 = doc::lit("Vec");
// doc d2 = doc::lit("<T>");
// doc d3 = d1.concat(d2);
// d3.last_width() -> 6
// d3.as_string() -> "Vec<T>"
// ```
class doc {
 private:
  std::shared_ptr<doc_impl_base> impl;

  explicit doc(std::shared_ptr<doc_impl_base> impl) : impl(std::move(impl)) {}

 public:
  doc(const doc& other) = default;
  doc(doc&& other) = default;
  doc& operator=(const doc& other) = default;
  doc& operator=(doc&& other) = default;

  // O(n) (n = byte count)
  static doc lit(std::string str) { return doc(std::make_shared<doc_impl_string>(std::move(str))); }

  static doc empty() { return lit(""); }

  // O(1)
  doc concat(doc r) const { return doc(std::make_shared<doc_impl_pair>(impl, r.impl)); }

  // O(n)
  std::string as_string() const {
    std::stringstream ss;
    impl->write(ss);
    return ss.str();
  }

  // O(n)
  void write(std::ostream& ostream) const { impl->write(ostream); }

  const doc_state& operator*() const { return **impl; }
  const doc_state& operator->() const { return **impl; }

  size_t byte_count() const { return (**impl).byte_count(); }
  size_t newline_count() const { return (**impl).newline_count(); }
  size_t first_width() const { return (**impl).first_width(); }
  size_t last_width() const { return (**impl).last_width(); }
  size_t max_width() const { return (**impl).max_width(); }
  size_t height() const { return (**impl).height(); }
  bool has_newline() const { return (**impl).has_newline(); }
  bool is_empty() const { return byte_count() == 0; }

  friend doc_builder;
};

inline std::ostream& operator<<(std::ostream& os, const doc& d) {
  d.write(os);
  return os;
}

// `doc_builder` accumulates the pieces of one rendering. Its geometry is
// available at every step so a renderer can ask how far along the current
// line it already is before rendering the next piece.
//
// Examples:
// ```
// doc_builder b;
// b.append("std");
// b.append("::");
// b.last_width() -> 5
// doc d = std::move(b).build();
// d.as_string() -> "std::"
// ```
class doc_builder {
 private:
  std::vector<doc> docs;
  doc_state state = doc_state::identity();

  doc merge(size_t start, size_t end) {
    if (start == end) {
      return docs[start];
    }

    size_t middle = start + (end - start) / 2;

    doc left = merge(start, middle);
    doc right = merge(middle + 1, end);

    return left.concat(right);
  }

 public:
  void append(std::string str) { append(doc::lit(std::move(str))); }

  void append(doc other) {
    state = state + *other;
    docs.push_back(std::move(other));
  }

  void undo() {
    if (docs.empty()) return;
    docs.pop_back();
    state = doc_state::identity();
    for (const auto& d : docs) {
      state = state + *d;
    }
  }

  const doc_state& operator*() const { return state; }
  const doc_state& operator->() const { return state; }

  size_t byte_count() const { return state.byte_count(); }
  size_t newline_count() const { return state.newline_count(); }
  size_t first_width() const { return state.first_width(); }
  size_t last_width() const { return state.last_width(); }
  size_t max_width() const { return state.max_width(); }
  size_t height() const { return state.height(); }
  bool has_newline() const { return state.has_newline(); }

  doc build() && {
    if (docs.empty()) {
      return doc::empty();
    }
    doc copy = merge(0, docs.size() - 1);
    docs = {};
    state = doc_state::identity();
    return copy;
  }
};

}  // namespace tyfmt
