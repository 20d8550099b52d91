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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include "tracing.h"

#include <stdio.h>
#include <time.h>
#include <unistd.h>

#include <vector>

namespace tyfmt {
namespace log {

static std::vector<std::unique_ptr<Subscriber>> subscribers;

void subscribe(std::unique_ptr<Subscriber> subscriber) {
  subscribers.emplace_back(std::move(subscriber));
}

void clear_subscribers() { subscribers.clear(); }

bool has_subscribers() { return !subscribers.empty(); }

Event event() {
  Event e({});
  return e;
}

Event Event::message(const char* fmt, va_list args) && {
  va_list copy;
  va_copy(copy, args);
  int size = vsnprintf(NULL, 0, fmt, copy);
  va_end(copy);

  if (size < 0) {
    items[LOG_MESSAGE] = fmt;
    return std::move(*this);
  }

  std::string buffer(size, '\0');
  vsnprintf(&buffer[0], buffer.size() + 1, fmt, args);

  items[LOG_MESSAGE] = std::move(buffer);
  return std::move(*this);
}

Event Event::message(const char* fmt, ...) && {
  va_list args;
  va_start(args, fmt);
  Event out = std::move(*this).message(fmt, args);
  va_end(args);
  return out;
}

Event Event::with(const std::string& key, std::string value) && {
  items[key] = std::move(value);
  return std::move(*this);
}

Event Event::time() && {
  timespec tp;
  clock_gettime(CLOCK_REALTIME, &tp);
  std::string nano = std::to_string(tp.tv_nsec);
  struct tm tm;
  localtime_r(&tp.tv_sec, &tm);
  char time_buffer[20 + 1];
  strftime(time_buffer, sizeof(time_buffer), "%FT%T", &tm);
  nano.resize(9, '0');
  items[LOG_TIME] = std::string(time_buffer) + "." + nano;

  return std::move(*this);
}

Event Event::pid() && {
  items[LOG_PID] = std::to_string(getpid());
  return std::move(*this);
}

Event Event::level(const char* level) && {
  items[LOG_LEVEL] = level;
  return std::move(*this);
}

void Event::operator()() && {
  for (const auto& subscriber : subscribers) {
    subscriber->receive(*this);
  }
}

static Event leveled(const char* level, const char* fmt, va_list args) {
  // Without subscribers the event is dropped unread.
  if (subscribers.empty()) {
    return event().level(level);
  }
  return event().level(level).pid().time().message(fmt, args);
}

Event debug(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Event out = leveled(LOG_LEVEL_DEBUG, fmt, args);
  va_end(args);
  return out;
}

Event info(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Event out = leveled(LOG_LEVEL_INFO, fmt, args);
  va_end(args);
  return out;
}

Event warning(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Event out = leveled(LOG_LEVEL_WARNING, fmt, args);
  va_end(args);
  return out;
}

Event error(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Event out = leveled(LOG_LEVEL_ERROR, fmt, args);
  va_end(args);
  return out;
}

void FormatSubscriber::receive(const Event& e) {
  s << "[";

  bool insert_sep = false;
  for (const auto& item : e.items) {
    if (item.first == LOG_MESSAGE) {
      continue;
    }

    if (insert_sep) {
      s << ", ";
    }
    insert_sep = true;

    s << item.first << "=" << item.second;
  }

  s << "] ";

  if (auto* value = e.get(LOG_MESSAGE)) {
    s << *value;
  } else {
    s << "<empty message>";
  }

  s << std::endl;
}

void SimpleFormatSubscriber::receive(const Event& e) {
  if (auto* level = e.get(LOG_LEVEL)) {
    s << "[" << *level << "]: ";
  }

  if (auto* value = e.get(LOG_MESSAGE)) {
    s << *value;
  } else {
    s << "<empty message>";
  }

  s << std::endl;
}

void FilterSubscriber::receive(const Event& e) {
  if (predicate(e)) {
    subscriber->receive(e);
  }
}

}  // namespace log
}  // namespace tyfmt
