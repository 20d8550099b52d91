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
#include <new>
#include <type_traits>
#include <utility>

#include "optional.h"

namespace tyfmt {

// Tag used to select the error constructor.
class in_place_error_t {};

static constexpr size_t max_align(size_t a, size_t b) { return (a < b) ? b : a; }

// A value or an error, never both. Unlike `optional`, a moved-from result
// keeps its errorness; only the payload is moved.
template <class T, class E>
class alignas(max_align(alignof(T), alignof(E))) result {
 private:
  union {
    T value;
    E error_;
  };
  bool is_error = true;

  void destroy() {
    if (is_error) {
      error_.~E();
    } else {
      value.~T();
    }
  }

 public:
  result() = delete;

  template <class... Args>
  result(in_place_t, Args&&... args) : value(std::forward<Args>(args)...), is_error(false) {}

  template <class... Args>
  result(in_place_error_t, Args&&... args) : error_(std::forward<Args>(args)...), is_error(true) {}

  result(const result& other) : is_error(other.is_error) {
    if (is_error) {
      new (&error_) E(other.error_);
    } else {
      new (&value) T(other.value);
    }
  }

  result(result&& other) : is_error(other.is_error) {
    if (is_error) {
      new (&error_) E(std::move(other.error_));
    } else {
      new (&value) T(std::move(other.value));
    }
  }

  ~result() { destroy(); }

  result& operator=(const result& other) {
    if (this == &other) return *this;
    destroy();
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(other.error_);
    } else {
      new (&value) T(other.value);
    }
    return *this;
  }

  result& operator=(result&& other) {
    if (this == &other) return *this;
    destroy();
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(std::move(other.error_));
    } else {
      new (&value) T(std::move(other.value));
    }
    return *this;
  }

  explicit operator bool() const { return !is_error; }

  T& operator*() { return value; }
  const T& operator*() const { return value; }

  T* operator->() { return &value; }
  const T* operator->() const { return &value; }

  E& error() { return error_; }
  const E& error() const { return error_; }
};

// Creates a result holding `x`. The error type must be named:
// result_value<ConfigError>(config) is a result<Config, ConfigError>.
template <class E, class T>
result<typename std::decay<T>::type, E> result_value(T&& x) {
  return result<typename std::decay<T>::type, E>{in_place_t{}, std::forward<T>(x)};
}

template <class T, class E, class... Args>
result<T, E> make_result(Args&&... args) {
  return result<T, E>{in_place_t{}, std::forward<Args>(args)...};
}

// Creates a result holding the error `err`. The value type must be named.
template <class T, class E>
result<T, typename std::decay<E>::type> result_error(E&& err) {
  return result<T, typename std::decay<E>::type>{in_place_error_t{}, std::forward<E>(err)};
}

template <class T, class E, class... Args>
result<T, E> make_error(Args&&... args) {
  return result<T, E>{in_place_error_t{}, std::forward<Args>(args)...};
}

}  // namespace tyfmt
