/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * urifetch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * urifetch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with urifetch.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <urifetch/work_queue.h>

using namespace urifetch;
using ::testing::ElementsAre;

namespace {

std::vector<std::string> drain(work_queue& q) {
  std::vector<std::string> rv;
  while (!q.empty()) {
    rv.push_back(q.pop_front());
  }
  return rv;
}

} // namespace

TEST(work_queue, seed_order) {
  work_queue q({"a", "b", "c"});
  EXPECT_EQ(3, q.size());
  EXPECT_EQ("a", q.front());
  EXPECT_THAT(drain(q), ElementsAre("a", "b", "c"));
}

TEST(work_queue, push_front_single) {
  work_queue q({"a", "b"});
  EXPECT_EQ("a", q.pop_front());
  q.push_front("a.gz");
  q.push_back("z");
  EXPECT_THAT(drain(q), ElementsAre("a.gz", "b", "z"));
}

TEST(work_queue, push_front_keeps_relative_order) {
  work_queue q({"list", "later"});
  EXPECT_EQ("list", q.pop_front());

  std::vector<std::string> discovered{"x1", "x2", "x3"};
  q.push_front(discovered);

  EXPECT_EQ("x1", q.pop_front());

  // nested indirection resolves depth first
  std::vector<std::string> nested{"y1", "y2"};
  q.push_front(nested);

  EXPECT_THAT(drain(q), ElementsAre("y1", "y2", "x2", "x3", "later"));
}

TEST(work_queue, push_front_empty_span) {
  work_queue q({"a"});
  q.push_front(std::vector<std::string>{});
  EXPECT_THAT(drain(q), ElementsAre("a"));
  EXPECT_TRUE(q.empty());
}
