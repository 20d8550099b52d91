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

#include <cstdarg>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>

namespace tyfmt {
namespace log {

static constexpr const char* LOG_LEVEL = "level";
static constexpr const char* LOG_TIME = "time";
static constexpr const char* LOG_PID = "pid";
static constexpr const char* LOG_LEVEL_DEBUG = "debug";
static constexpr const char* LOG_LEVEL_INFO = "info";
static constexpr const char* LOG_LEVEL_WARNING = "warning";
static constexpr const char* LOG_LEVEL_ERROR = "error";
static constexpr const char* LOG_MESSAGE = "message";

// An event is a bag of key/value items. It is built up with the rvalue
// methods below and delivered to every subscriber when invoked:
//
//   log::info("placed %zu items", n)();
//   log::warning("missing `<`").with("file", name)();
struct Event {
  std::unordered_map<std::string, std::string> items;

  Event(std::initializer_list<std::pair<const std::string, std::string>> list) : items(list) {}

  const std::string* get(const std::string& key) const {
    auto it = items.find(key);
    if (it == items.end()) {
      return nullptr;
    }

    return &it->second;
  }

  Event message(const char* fmt, ...) && __attribute__((format(printf, 2, 3)));
  Event message(const char* fmt, va_list args) &&;

  Event with(const std::string& key, std::string value) && __attribute__((warn_unused_result));
  Event time() && __attribute__((warn_unused_result));
  Event pid() && __attribute__((warn_unused_result));
  Event level(const char* level) && __attribute__((warn_unused_result));

  void operator()() &&;
};

// Abstract
class Subscriber {
 public:
  virtual void receive(const Event& e) = 0;
  virtual ~Subscriber() {}
};

// Writes `[key=value, ...] message` lines.
class FormatSubscriber : public Subscriber {
 private:
  std::ostream s;

 public:
  FormatSubscriber(std::streambuf* rdbuf) : s(rdbuf) {}
  void receive(const Event& e) override;
};

// Writes `[level]: message` lines.
class SimpleFormatSubscriber : public Subscriber {
 private:
  std::ostream s;

 public:
  SimpleFormatSubscriber(std::streambuf* rdbuf) : s(rdbuf) {}
  void receive(const Event& e) override;
};

// Forwards the events accepted by `predicate` to `subscriber`.
class FilterSubscriber : public Subscriber {
 private:
  std::unique_ptr<Subscriber> subscriber;
  std::function<bool(const Event&)> predicate;

 public:
  FilterSubscriber(std::unique_ptr<Subscriber> subscriber,
                   std::function<bool(const Event&)> predicate)
      : subscriber(std::move(subscriber)), predicate(std::move(predicate)) {}
  void receive(const Event& e) override;
};

void subscribe(std::unique_ptr<Subscriber>);
void clear_subscribers();
bool has_subscribers();

Event event() __attribute__((warn_unused_result));

Event debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)))
__attribute__((warn_unused_result));
Event info(const char* fmt, ...) __attribute__((format(printf, 1, 2)))
__attribute__((warn_unused_result));
Event warning(const char* fmt, ...) __attribute__((format(printf, 1, 2)))
__attribute__((warn_unused_result));
Event error(const char* fmt, ...) __attribute__((format(printf, 1, 2)))
__attribute__((warn_unused_result));

}  // namespace log
}  // namespace tyfmt
