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

#include "unit.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>

#include "util/term.h"

struct Test {
  std::string test_name;
  TestFunc test;
  std::set<std::string> tags;
  Test(const char* test_name_, TestFunc test_, std::set<std::string> tags)
      : test_name(test_name_), test(test_), tags(tags) {}
};

// Every registered test. A static local so that registration works no matter
// which order the test objects are linked and initialised in.
static std::vector<Test>* get_tests() {
  static std::vector<Test> tests;
  return &tests;
}

TestRegister::TestRegister(const char* test_name, TestFunc test,
                           std::initializer_list<const char*> tags) {
  std::set<std::string> test_tags;
  for (const auto* tag : tags) {
    test_tags.emplace(tag);
  }
  get_tests()->emplace_back(test_name, test, std::move(test_tags));
}

struct Options {
  bool no_color = false;
  bool list = false;
  std::vector<std::string> prefixes;
  std::set<std::string> tags;

  // A test is selected when its name starts with one of the prefixes (or no
  // prefix was given) and every one of its tags was asked for. Tagged tests
  // are therefore skipped by default.
  bool selects(const Test& test) const {
    bool prefix_ok = prefixes.empty();
    for (const auto& prefix : prefixes) {
      if (test.test_name.compare(0, prefix.size(), prefix) == 0) prefix_ok = true;
    }
    if (!prefix_ok) return false;

    for (const auto& tag : test.tags) {
      if (tags.count(tag) == 0) return false;
    }
    return true;
  }
};

static const char* usage =
    "usage: tyfmt-unit [--no-color] [--list] [--prefix NAME]... [--tag TAG]...\n";

static bool parse_options(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;
    if (strcmp(arg, "--no-color") == 0) {
      options.no_color = true;
    } else if (strcmp(arg, "--list") == 0) {
      options.list = true;
    } else if (strcmp(arg, "--prefix") == 0 && has_value) {
      options.prefixes.emplace_back(argv[++i]);
    } else if (strcmp(arg, "--tag") == 0 && has_value) {
      options.tags.emplace(argv[++i]);
    } else {
      std::cerr << "tyfmt-unit: unexpected argument '" << arg << "'\n" << usage;
      return false;
    }
  }
  return true;
}

static void open_log() {
  static std::filebuf log_file;
  if (!log_file.open("tyfmt-unit.log", std::ios::out | std::ios::trunc)) {
    std::cerr << "Unable to init logging: tyfmt-unit.log failed to open: " << strerror(errno)
              << std::endl;
    return;
  }
  tyfmt::log::subscribe(std::make_unique<tyfmt::log::FormatSubscriber>(&log_file));
}

static void print_errors(const TestLogger& logger, bool color) {
  for (auto& err : logger.errors) {
    if (color) std::cerr << term_intensity(2);
    std::cerr << err->file << ":" << err->line << ": ";
    if (color) std::cerr << term_colour(TERM_RED);
    std::cerr << "error: ";
    if (color) std::cerr << term_normal();
    std::cerr << "in " << err->test_name << std::endl;
    std::string msg = err->user_error.str();
    if (!msg.empty()) std::cerr << msg << std::endl;
    std::cerr << err->predicate_error.str() << std::endl;
  }
}

static void print_group(std::ostream& os, const char* title, const std::set<std::string>& names,
                        int colour, bool color) {
  if (names.empty()) return;
  if (color) os << term_colour(colour);
  os << title << std::endl;
  for (auto& name : names) os << "  " << name << std::endl;
  if (color) os << term_normal();
}

int main(int argc, char** argv) {
  Options options;
  if (!parse_options(argc, argv, options)) return 2;

  if (options.list) {
    for (auto& test : *get_tests()) {
      if (options.selects(test)) std::cout << test.test_name << std::endl;
    }
    return 0;
  }

  bool color = term_init(!options.no_color, true);
  open_log();

  TestLogger logger;
  std::set<std::string> passing_tests;
  size_t ran = 0;
  for (auto& test : *get_tests()) {
    if (!options.selects(test)) continue;
    size_t num_errors = logger.errors.size();
    logger.test_name = test.test_name.c_str();
    ++ran;
    if (setjmp(logger.return_jmp_buffer)) {
      // An assert failed. The failure is recorded, keep running the rest.
      continue;
    }
    tyfmt::log::info("running %s", test.test_name.c_str()).with("test", test.test_name)();
    test.test(logger);
    if (num_errors == logger.errors.size()) passing_tests.emplace(test.test_name);
  }

  std::set<std::string> failed_tests;
  for (auto& err : logger.errors) failed_tests.emplace(err->test_name);

  print_errors(logger, color);
  print_group(std::cerr, "FAILED:", failed_tests, TERM_RED, color);
  print_group(std::cout, "PASSED:", passing_tests, TERM_GREEN, color);

  tyfmt::log::info("%zu tests, %zu failed", ran, failed_tests.size())();
  tyfmt::log::clear_subscribers();

  if (!failed_tests.empty()) {
    std::cerr << "\n\nFAILURE (" << failed_tests.size() << " of " << ran << ")" << std::endl;
    return 1;
  }
  std::cout << "\n\nSUCCESS (" << ran << ")" << std::endl;
  return 0;
}
