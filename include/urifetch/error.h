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

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

#include <urifetch/source_location.h>

namespace urifetch {

class error : public std::exception {
 public:
  auto location() const { return loc_; }
  auto file() const { return loc_.file_name(); }
  auto line() const { return loc_.line(); }

 protected:
  error(source_location loc) noexcept;

 private:
  source_location loc_;
};

class runtime_error : public error {
 public:
  runtime_error(std::string_view s, source_location loc);

  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

class system_error : public error {
 public:
  system_error(std::string_view s, source_location loc);
  system_error(std::string_view s, int err, source_location loc);

  char const* what() const noexcept override { return syserr_.what(); }
  std::error_code const& code() const noexcept { return syserr_.code(); }
  int get_errno() const { return code().value(); }

 private:
  std::system_error syserr_;
};

// No driver is registered for a URI scheme.
class no_driver_error : public runtime_error {
 public:
  no_driver_error(std::string_view scheme, source_location loc);

  std::string const& scheme() const { return scheme_; }

 private:
  std::string scheme_;
};

// The output path of a URI exists and must not be replaced.
class sink_conflict_error : public runtime_error {
 public:
  using runtime_error::runtime_error;
};

// Unpacking or packing a local artifact failed.
class archive_error : public runtime_error {
 public:
  using runtime_error::runtime_error;
};

#define URIFETCH_THROW(cls, ...)                                               \
  throw cls(__VA_ARGS__, URIFETCH_CURRENT_SOURCE_LOCATION)

#define URIFETCH_CHECK(expr, message)                                          \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::urifetch::assertion_failed(#expr, message,                             \
                                   URIFETCH_CURRENT_SOURCE_LOCATION);          \
    }                                                                          \
  } while (false)

[[noreturn]] void assertion_failed(std::string_view expr, std::string_view msg,
                                   source_location loc);

} // namespace urifetch
