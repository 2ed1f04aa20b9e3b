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

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include <urifetch/error.h>
#include <urifetch/util.h>

namespace urifetch {

namespace {

std::string located(std::string_view s, source_location const& loc) {
  return fmt::format("[{}:{}] {}", basename(loc.file_name()), loc.line(), s);
}

} // namespace

error::error(source_location loc) noexcept
    : loc_{loc} {}

runtime_error::runtime_error(std::string_view s, source_location loc)
    : error{loc}
    , what_{located(s, loc)} {}

system_error::system_error(std::string_view s, source_location loc)
    : system_error(s, errno, loc) {}

system_error::system_error(std::string_view s, int err, source_location loc)
    : error{loc}
    , syserr_{err, std::generic_category(), located(s, loc)} {}

no_driver_error::no_driver_error(std::string_view scheme, source_location loc)
    : runtime_error{fmt::format("no driver available for scheme '{}'", scheme),
                    loc}
    , scheme_{scheme} {}

void assertion_failed(std::string_view expr, std::string_view msg,
                      source_location loc) {
  std::cerr << fmt::format("internal error: {} ({}) at {}:{}\n", msg, expr,
                           loc.file_name(), loc.line());
  std::abort();
}

} // namespace urifetch
