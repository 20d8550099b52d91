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

#include "rewrite/config.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "unit.h"

using namespace tyfmt;

TEST(config_defaults) {
  Config config;
  EXPECT_EQUAL(100u, config.max_width);
  EXPECT_EQUAL(80u, config.ideal_width);
  EXPECT_EQUAL(5u, config.leeway);
  EXPECT_EQUAL(4u, config.tab_spaces);
  EXPECT_TRUE(config.where_indent == BlockIndentStyle::Tabbed);
  EXPECT_TRUE(config.where_pred_indent == BlockIndentStyle::Visual);
  EXPECT_TRUE(config.where_layout == ListTactic::Vertical);
  EXPECT_TRUE(config.normalize_comments);
  EXPECT_TRUE(config.wrap_comments);
}

TEST(config_parse) {
  auto config = config::parse(R"({
    "max_width": 80,
    "tab_spaces": 2,
    "where_indent": "Inherit",
    "where_layout": "Mixed",
    "wrap_comments": false
  })");
  ASSERT_TRUE((bool)config);
  EXPECT_EQUAL(80u, config->max_width);
  EXPECT_EQUAL(2u, config->tab_spaces);
  EXPECT_EQUAL(80u, config->ideal_width);
  EXPECT_TRUE(config->where_indent == BlockIndentStyle::Inherit);
  EXPECT_TRUE(config->where_pred_indent == BlockIndentStyle::Visual);
  EXPECT_TRUE(config->where_layout == ListTactic::Mixed);
  EXPECT_FALSE(config->wrap_comments);
  EXPECT_TRUE(config->normalize_comments);

  auto empty = config::parse("{}");
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL(100u, empty->max_width);
}

TEST(config_print) {
  Config config;
  config.where_layout = ListTactic::HorizontalVertical;
  std::stringstream out;
  out << config;
  std::string text = out.str();
  EXPECT_TRUE(text.find("  max_width = 100\n") != std::string::npos);
  EXPECT_TRUE(text.find("  where_layout = HorizontalVertical\n") != std::string::npos);
  EXPECT_TRUE(text.find("  wrap_comments = true\n") != std::string::npos);
}

TEST(config_unknown_key) {
  auto config = config::parse(R"({"max_width": 80, "spaces": 2})");
  ASSERT_FALSE((bool)config);
  EXPECT_TRUE(config.error().kind == ConfigErrorKind::UnknownKey);
  EXPECT_EQUAL("unknown key 'spaces'", config.error().message);

  auto several = config::parse(R"({"b": 1, "a": 2})");
  ASSERT_FALSE((bool)several);
  EXPECT_EQUAL("unknown key 'a', 'b'", several.error().message);
}

TEST(config_invalid_value) {
  auto width = config::parse(R"({"max_width": "wide"})");
  ASSERT_FALSE((bool)width);
  EXPECT_TRUE(width.error().kind == ConfigErrorKind::InvalidValue);
  EXPECT_EQUAL("invalid value \"wide\" for 'max_width'", width.error().message);

  auto negative = config::parse(R"({"leeway": -1})");
  ASSERT_FALSE((bool)negative);
  EXPECT_TRUE(negative.error().kind == ConfigErrorKind::InvalidValue);
  EXPECT_EQUAL("invalid value -1 for 'leeway'", negative.error().message);

  auto style = config::parse(R"({"where_indent": "tabbed"})");
  ASSERT_FALSE((bool)style);
  EXPECT_TRUE(style.error().kind == ConfigErrorKind::InvalidValue);

  auto flag = config::parse(R"({"normalize_comments": "yes"})");
  ASSERT_FALSE((bool)flag);
  EXPECT_TRUE(flag.error().kind == ConfigErrorKind::InvalidValue);
}

TEST(config_malformed) {
  auto broken = config::parse(R"({"max_width": 80)");
  ASSERT_FALSE((bool)broken);
  EXPECT_TRUE(broken.error().kind == ConfigErrorKind::Malformed);
  EXPECT_EQUAL("must be valid JSON", broken.error().message);

  auto array = config::parse("[1, 2]");
  ASSERT_FALSE((bool)array);
  EXPECT_TRUE(array.error().kind == ConfigErrorKind::Malformed);
  EXPECT_EQUAL("must be a JSON object", array.error().message);
}

TEST(config_load_missing_file) {
  auto config = config::load("/nonexistent/tyfmt.json");
  ASSERT_FALSE((bool)config);
  EXPECT_TRUE(config.error().kind == ConfigErrorKind::BadFile);
  EXPECT_EQUAL("Failed to read '/nonexistent/tyfmt.json'", config.error().message);
}

TEST(config_load) {
  const char *path = "tyfmt-unit-config.json";
  {
    std::ofstream out(path);
    out << R"({"ideal_width": 72})";
  }
  auto config = config::load(path);
  ASSERT_TRUE((bool)config);
  EXPECT_EQUAL(72u, config->ideal_width);

  {
    std::ofstream out(path);
    out << R"({"ideal_width": 72, "width": 3})";
  }
  auto broken = config::load(path);
  std::remove(path);
  ASSERT_FALSE((bool)broken);
  EXPECT_TRUE(broken.error().kind == ConfigErrorKind::UnknownKey);
  EXPECT_EQUAL("tyfmt-unit-config.json: unknown key 'width'", broken.error().message);
}
