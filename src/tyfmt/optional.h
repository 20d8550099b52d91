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
#include <cstdint>
#include <new>
#include <ostream>
#include <type_traits>
#include <utility>

namespace tyfmt {

struct in_place_t {
  explicit in_place_t() = default;
};

// An optional value. An empty optional returned from a renderer means the
// node could not be rendered in the space it was given.
//
// Moving out of an optional leaves the source empty. The copy operations are
// only instantiated when used so move-only payloads work as long as they are
// never copied.
template <class T>
class alignas(T) optional {
 private:
  union {
    uint8_t null_value;
    T value;
  };
  bool none = true;

  void reset() {
    if (!none) value.~T();
    none = true;
  }

 public:
  optional() : null_value(), none(true) {}

  template <class... Args>
  optional(in_place_t, Args&&... args) : value(std::forward<Args>(args)...), none(false) {}

  optional(const optional& other) : null_value(), none(other.none) {
    if (!none) new (&value) T(other.value);
  }

  optional(optional&& other) : null_value(), none(other.none) {
    if (!none) {
      new (&value) T(std::move(other.value));
      other.reset();
    }
  }

  ~optional() { reset(); }

  optional& operator=(const optional& other) {
    if (this == &other) return *this;
    reset();
    none = other.none;
    if (!none) new (&value) T(other.value);
    return *this;
  }

  optional& operator=(optional&& other) {
    if (this == &other) return *this;
    reset();
    none = other.none;
    if (!none) {
      new (&value) T(std::move(other.value));
      other.reset();
    }
    return *this;
  }

  explicit operator bool() const { return !none; }

  T& operator*() { return value; }
  const T& operator*() const { return value; }

  T* operator->() { return &value; }
  const T* operator->() const { return &value; }

  T value_or(T other) const {
    if (none) return other;
    return value;
  }
};

// `some` wraps a known value without spelling out the template argument.
// Example: some(10) is a tyfmt::optional<int>
template <class T>
inline optional<typename std::decay<T>::type> some(T&& x) {
  return optional<typename std::decay<T>::type>{in_place_t{}, std::forward<T>(x)};
}

// `make_some` constructs the value in place with any of its constructors.
template <class T, class... Args>
inline optional<T> make_some(Args&&... args) {
  return optional<T>{in_place_t{}, std::forward<Args>(args)...};
}

// Width arithmetic never wraps around: running out of columns is reported as
// an empty optional.
inline optional<size_t> checked_sub(size_t a, size_t b) {
  if (b > a) return {};
  return some(a - b);
}

template <class T>
std::ostream& operator<<(std::ostream& os, const optional<T>& value) {
  if (value) {
    os << "{" << *value << "}";
  } else {
    os << "{}";
  }
  return os;
}

}  // namespace tyfmt
