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

#include "config.h"

#include <tyfmt/tracing.h>

#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <vector>

namespace tyfmt {

static const char *indent_style_name(BlockIndentStyle style) {
  switch (style) {
    case BlockIndentStyle::Inherit:
      return "Inherit";
    case BlockIndentStyle::Tabbed:
      return "Tabbed";
    case BlockIndentStyle::Visual:
      return "Visual";
  }
  return "?";
}

std::ostream &operator<<(std::ostream &os, const Config &config) {
  os << "Config {" << std::endl;
  os << "  max_width = " << config.max_width << std::endl;
  os << "  ideal_width = " << config.ideal_width << std::endl;
  os << "  leeway = " << config.leeway << std::endl;
  os << "  tab_spaces = " << config.tab_spaces << std::endl;
  os << "  where_indent = " << indent_style_name(config.where_indent) << std::endl;
  os << "  where_pred_indent = " << indent_style_name(config.where_pred_indent) << std::endl;
  os << "  where_layout = " << list_tactic_name(config.where_layout) << std::endl;
  os << "  normalize_comments = " << (config.normalize_comments ? "true" : "false") << std::endl;
  os << "  wrap_comments = " << (config.wrap_comments ? "true" : "false") << std::endl;
  return os << "}";
}

namespace config {

using json = nlohmann::json;

static bool set_size(const json &value, size_t &out) {
  if (!value.is_number_unsigned()) return false;
  out = value.get<size_t>();
  return true;
}

static bool set_bool(const json &value, bool &out) {
  if (!value.is_boolean()) return false;
  out = value.get<bool>();
  return true;
}

static bool set_indent_style(const json &value, BlockIndentStyle &out) {
  if (!value.is_string()) return false;
  const std::string &name = value.get_ref<const std::string &>();
  for (auto style :
       {BlockIndentStyle::Inherit, BlockIndentStyle::Tabbed, BlockIndentStyle::Visual}) {
    if (name == indent_style_name(style)) {
      out = style;
      return true;
    }
  }
  return false;
}

static bool set_list_tactic(const json &value, ListTactic &out) {
  if (!value.is_string()) return false;
  const std::string &name = value.get_ref<const std::string &>();
  for (auto tactic : {ListTactic::Horizontal, ListTactic::Vertical,
                      ListTactic::HorizontalVertical, ListTactic::Mixed}) {
    if (name == list_tactic_name(tactic)) {
      out = tactic;
      return true;
    }
  }
  return false;
}

// One setter per key. A setter rejects a value of the wrong shape and leaves
// the field untouched.
using Setter = std::function<bool(Config &, const json &)>;

static const std::map<std::string, Setter> &setters() {
  static const std::map<std::string, Setter> table = {
      {"max_width", [](Config &c, const json &v) { return set_size(v, c.max_width); }},
      {"ideal_width", [](Config &c, const json &v) { return set_size(v, c.ideal_width); }},
      {"leeway", [](Config &c, const json &v) { return set_size(v, c.leeway); }},
      {"tab_spaces", [](Config &c, const json &v) { return set_size(v, c.tab_spaces); }},
      {"where_indent",
       [](Config &c, const json &v) { return set_indent_style(v, c.where_indent); }},
      {"where_pred_indent",
       [](Config &c, const json &v) { return set_indent_style(v, c.where_pred_indent); }},
      {"where_layout",
       [](Config &c, const json &v) { return set_list_tactic(v, c.where_layout); }},
      {"normalize_comments",
       [](Config &c, const json &v) { return set_bool(v, c.normalize_comments); }},
      {"wrap_comments", [](Config &c, const json &v) { return set_bool(v, c.wrap_comments); }},
  };
  return table;
}

// Keys of `object` that no setter handles, in key order.
static std::vector<std::string> find_disallowed_keys(const json &object) {
  std::vector<std::string> disallowed;
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (setters().count(it.key()) == 0) disallowed.push_back(it.key());
  }
  return disallowed;
}

static result<Config, ConfigError> reject(ConfigErrorKind kind, std::string message) {
  log::error("config: %s", message.c_str())();
  return result_error<Config>(ConfigError{kind, std::move(message)});
}

result<Config, ConfigError> parse(const std::string &text) {
  json object = json::parse(text, nullptr, false);
  if (object.is_discarded()) {
    return reject(ConfigErrorKind::Malformed, "must be valid JSON");
  }
  if (!object.is_object()) {
    return reject(ConfigErrorKind::Malformed, "must be a JSON object");
  }

  auto disallowed = find_disallowed_keys(object);
  if (!disallowed.empty()) {
    std::string message = "unknown key '" + disallowed.front() + "'";
    for (size_t i = 1; i < disallowed.size(); ++i) message += ", '" + disallowed[i] + "'";
    return reject(ConfigErrorKind::UnknownKey, std::move(message));
  }

  Config config;
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (!setters().at(it.key())(config, it.value())) {
      return reject(ConfigErrorKind::InvalidValue,
                    "invalid value " + it.value().dump() + " for '" + it.key() + "'");
    }
  }

  return result_value<ConfigError>(config);
}

result<Config, ConfigError> load(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    return reject(ConfigErrorKind::BadFile, "Failed to read '" + path + "'");
  }

  std::stringstream buff;
  buff << file.rdbuf();

  auto config = parse(buff.str());
  if (!config) {
    ConfigError error = config.error();
    error.message = path + ": " + error.message;
    return result_error<Config>(std::move(error));
  }

  log::info("config: loaded '%s'", path.c_str()).with("file", path)();
  return config;
}

}  // namespace config
}  // namespace tyfmt
