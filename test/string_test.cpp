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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <urifetch/string.h>

using namespace urifetch;

TEST(string, split_to) {
  EXPECT_THAT(split_to<std::vector<std::string>>("a,b,c", ','),
              testing::ElementsAre("a", "b", "c"));
  EXPECT_THAT(split_to<std::vector<std::string>>(",b,", ','),
              testing::ElementsAre("", "b", ""));
  EXPECT_THAT(split_to<std::vector<std::string>>("", ','),
              testing::ElementsAre());
  EXPECT_THAT(split_to<std::vector<std::string_view>>("a,,c", ','),
              testing::ElementsAre("a", "", "c"));
  EXPECT_THAT(split_to<std::set<std::string>>("aa\nbb\nccc", '\n'),
              testing::ElementsAre("aa", "bb", "ccc"));
  EXPECT_THAT(split_to<std::vector<int>>("1,2,3", ','),
              testing::ElementsAre(1, 2, 3));
}

TEST(string, trim_and_case) {
  EXPECT_EQ("abc", trim("  \tabc\r\n"));
  EXPECT_EQ("", trim(" \n "));
  EXPECT_EQ("mixed case", to_lower("MiXeD CASE"));
  EXPECT_TRUE(iequals("Refresh", "REFRESH"));
  EXPECT_FALSE(iequals("Refresh", "Refres"));
  EXPECT_TRUE(starts_with_icase("<!DOCTYPE html>", "<!doctype html"));
  EXPECT_FALSE(starts_with_icase("<ht", "<html"));
}

TEST(string, expand_placeholders) {
  std::map<std::string, std::string, std::less<>> vars{
      {"uri", "http://h/x"}, {"dest", "/out/x"}, {"empty", ""}};

  auto lookup = [&](std::string_view name) -> std::optional<std::string> {
    if (auto it = vars.find(name); it != vars.end()) {
      return it->second;
    }
    return std::nullopt;
  };

  EXPECT_EQ("fetch http://h/x -> /out/x",
            expand_placeholders("fetch {uri} -> {dest}", lookup));
  EXPECT_EQ("--opt={unknown}", expand_placeholders("--opt={unknown}", lookup));
  EXPECT_EQ("[]", expand_placeholders("[{empty}]", lookup));
  EXPECT_EQ("open { brace", expand_placeholders("open { brace", lookup));
  EXPECT_EQ("{uri", expand_placeholders("{uri", lookup));
}
