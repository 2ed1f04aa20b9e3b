/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace urifetch {

class driver;
class logger;

// A driver defined at runtime that runs an external command line with
// `{uri}`, `{dest}`, `{user}`, `{password}`, `{retries}`, `{retry_delay}`,
// `{connect_timeout}` and `{cookie_jar}` placeholders.
struct command_driver_definition {
  std::string scheme;
  std::vector<std::string> command;
  std::string description{};
  std::set<int> not_found_exit_codes{};
  bool retry_in_adapter{false};
  std::map<std::string, std::string> env{};
};

std::unique_ptr<driver>
create_command_driver(logger& lgr, command_driver_definition def);

} // namespace urifetch
