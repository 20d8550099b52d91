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

#include <tyfmt/tracing.h>

#include <csetjmp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "util/term.h"

// Makes control characters visible in failure messages.
inline std::string escape_string(const std::string& str) {
  std::stringstream out;
  for (unsigned char c : str) {
    switch (c) {
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      case '\r':
        out << "\\r";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      default:
        if (c < 0x20) {
          out << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
              << std::dec;
        } else {
          out << c;
        }
    }
  }
  return out.str();
}

// Represents an error message to display to the user
struct ErrorMessage {
  // Test and failure location information
  const char* test_name;
  const char* file;
  int line;

  // The generated error message with precise details
  std::stringstream predicate_error;

  // The error message supplied by the user
  std::stringstream user_error;
};

// Returned by EXPECT_* and ASSERT_*. A failed ASSERT_* longjumps back to the
// harness once the user supplied message has been streamed in. The message
// is dropped when the check passed.
struct TestStream {
  std::stringstream* ss;
  std::jmp_buf* assert_throw;
  TestStream(std::stringstream* ss_, std::jmp_buf* assert_) : ss(ss_), assert_throw(assert_) {}
  ~TestStream() {
    if (assert_throw) std::longjmp(*assert_throw, 1);
  }
  template <class T>
  TestStream& operator<<(T&& x) {
    if (ss) *ss << x;
    return *this;
  }
};

// Public:
struct TestLogger {
  // stringstream is not copyable on every libstdc++
  std::vector<std::unique_ptr<ErrorMessage>> errors;
  std::jmp_buf return_jmp_buffer;
  const char* test_name = nullptr;

 private:
  TestStream fail(ErrorMessage& err, bool assert) {
    return TestStream(&err.user_error, assert ? &return_jmp_buffer : nullptr);
  }

  ErrorMessage& new_error(int line, const char* file) {
    errors.emplace_back(new ErrorMessage);
    auto& err = errors.back();
    err->test_name = test_name;
    err->file = file;
    err->line = line;
    return *err;
  }

 public:
  TestStream expect(bool assert, bool expected, bool cond, const char* cond_str, int line,
                    const char* file) {
    if (cond == expected) return TestStream(nullptr, nullptr);
    auto expected_str = expected ? "true" : "false";
    auto actual_str = cond ? "true" : "false";
    auto& err = new_error(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << cond_str << "`";
    err.predicate_error << term_normal() << " to be ";
    err.predicate_error << term_colour(TERM_MAGENTA) << expected_str;
    err.predicate_error << term_normal() << ", but was found to be ";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
    err.predicate_error << term_normal() << std::endl;
    tyfmt::log::info("expected `%s` to be %s but found %s", cond_str, expected_str, actual_str)();
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, std::vector<std::string> expected,
                          std::vector<std::string> actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected.size() != actual.size()) {
      auto& err = new_error(line, file);
      err.predicate_error << "Expected vector length:\n\t" << term_colour(TERM_MAGENTA)
                          << expected.size();
      err.predicate_error << term_normal() << "\nBut actual vector length was:\n\t";
      err.predicate_error << term_colour(TERM_MAGENTA) << actual.size();
      err.predicate_error << term_normal() << std::endl;
      tyfmt::log::info("expected vector length of %zu but actual length was %zu",
                       expected.size(), actual.size())();
      return fail(err, assert);
    }

    for (size_t i = 0; i < expected.size(); ++i) {
      if (expected[i] != actual[i]) {
        auto& err = new_error(line, file);
        err.predicate_error << "Expected vectors to be equal:\n\t" << term_colour(TERM_MAGENTA)
                            << expected_str;
        err.predicate_error << term_normal() << "\nAnd:\n\t";
        err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
        err.predicate_error << term_normal() << "\nBut were found to differ at index " << i;
        err.predicate_error << term_colour(TERM_MAGENTA) << "\n\t(" << actual_str << ")[" << i
                            << "] = \"" << escape_string(actual[i]) << "\"\n";
        err.predicate_error << term_normal() << "But:\n\t" << term_colour(TERM_MAGENTA) << "("
                            << expected_str << ")[" << i << "] = \""
                            << escape_string(expected[i]) << "\"\n";
        err.predicate_error << term_normal() << std::endl;
        tyfmt::log::info("expected %s and %s to be equal: but (%s)[%zu] != (%s)[%zu]",
                         expected_str, actual_str, actual_str, i, expected_str, i)();
        return fail(err, assert);
      }
    }

    return TestStream(nullptr, nullptr);
  }

  TestStream expect_equal(bool assert, int expected, int actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = new_error(line, file);
    err.predicate_error << "Expected:\n\t" << term_colour(TERM_MAGENTA) << expected;
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual;
    err.predicate_error << term_normal() << std::endl;
    tyfmt::log::info("expected %d but got %d at %s:%d", expected, actual, file, line)();
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, size_t expected, size_t actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = new_error(line, file);
    err.predicate_error << "Expected:\n\t" << term_colour(TERM_MAGENTA) << expected;
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual;
    err.predicate_error << term_normal() << std::endl;
    tyfmt::log::info("expected %zu but got %zu at %s:%d", expected, actual, file, line)();
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, std::string expected, std::string actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = new_error(line, file);
    err.predicate_error << "Expected:\n\t"
                        << "(" << expected.size() << ")" << term_colour(TERM_MAGENTA) << '"'
                        << escape_string(expected) << '"';
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << "(" << actual.size() << ")" << term_colour(TERM_MAGENTA) << '"'
                        << escape_string(actual) << '"';
    err.predicate_error << term_normal() << std::endl;
    tyfmt::log::info("expected %s but got %s at %s:%d", escape_string(expected).c_str(),
                     escape_string(actual).c_str(), file, line)();
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, const char* expected, std::string actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    return expect_equal(assert, std::string(expected), std::move(actual), expected_str,
                        actual_str, line, file);
  }

  template <class T1, class T2>
  TestStream expect_equal(bool assert, T1&& expected, T2&& actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = new_error(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << expected_str << "`";
    err.predicate_error << term_normal() << " to be equal to `";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
    err.predicate_error << "`" << term_normal() << ", but was found to differ";
    tyfmt::log::info("expected `%s` == `%s` but was false at %s:%d", expected_str, actual_str,
                     file, line)();
    return fail(err, assert);
  }
};

#define NUM_ERRORS() (logger__.errors.size())

// Public:
#define EXPECT_TRUE(cond) (logger__.expect(false, true, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_TRUE(cond) (logger__.expect(true, true, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_FALSE(cond) (logger__.expect(false, false, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_FALSE(cond) (logger__.expect(true, false, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_EQUAL(x, y) (logger__.expect_equal(false, (x), (y), #x, #y, __LINE__, __FILE__))
#define ASSERT_EQUAL(x, y) (logger__.expect_equal(true, (x), (y), #x, #y, __LINE__, __FILE__))

using TestFunc = void (*)(TestLogger&);

struct TestRegister {
  TestRegister(const char* test_name, TestFunc test, std::initializer_list<const char*> tags);
};

#define TEST(name, ...)                                                          \
  static void Test__##name(TestLogger&);                                         \
  static TestRegister Test__Unique__##name(#name, &Test__##name, {__VA_ARGS__}); \
  static void Test__##name(TestLogger& logger__)
