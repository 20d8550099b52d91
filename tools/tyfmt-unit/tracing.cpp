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

#include <tyfmt/tracing.h>

#include <sstream>

#include "unit.h"

TEST(tracing_event_items) {
  auto e = tyfmt::log::event().level(tyfmt::log::LOG_LEVEL_WARNING).with("file", "lib.rs");
  auto e2 = std::move(e).message("missing `%s` after %d bytes", "<", 12);

  ASSERT_TRUE(e2.get(tyfmt::log::LOG_LEVEL) != nullptr);
  EXPECT_EQUAL("warning", *e2.get(tyfmt::log::LOG_LEVEL));
  EXPECT_EQUAL("lib.rs", *e2.get("file"));
  EXPECT_EQUAL("missing `<` after 12 bytes", *e2.get(tyfmt::log::LOG_MESSAGE));
  EXPECT_TRUE(e2.get("absent") == nullptr);
}

TEST(tracing_format_subscriber) {
  std::stringstream out;
  tyfmt::log::FormatSubscriber subscriber(out.rdbuf());

  auto e = tyfmt::log::event().with("tactic", "Vertical").message("placed %d items", 3);
  subscriber.receive(e);

  EXPECT_EQUAL("[tactic=Vertical] placed 3 items\n", out.str());
}

TEST(tracing_simple_format_subscriber) {
  std::stringstream out;
  tyfmt::log::SimpleFormatSubscriber subscriber(out.rdbuf());

  subscriber.receive(tyfmt::log::event().level("error").message("unknown key"));
  subscriber.receive(tyfmt::log::event().level("info"));

  EXPECT_EQUAL("[error]: unknown key\n[info]: <empty message>\n", out.str());
}

TEST(tracing_filter_subscriber) {
  std::stringstream out;
  tyfmt::log::FilterSubscriber subscriber(
      std::make_unique<tyfmt::log::SimpleFormatSubscriber>(out.rdbuf()),
      [](const tyfmt::log::Event& e) {
        const std::string* level = e.get(tyfmt::log::LOG_LEVEL);
        return level && *level != tyfmt::log::LOG_LEVEL_DEBUG;
      });

  subscriber.receive(tyfmt::log::event().level("debug").message("dropped"));
  subscriber.receive(tyfmt::log::event().level("warning").message("kept"));

  EXPECT_EQUAL("[warning]: kept\n", out.str());
}
