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

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <termios.h>

#include <folly/portability/Unistd.h>

#include <urifetch/terminal_ansi.h>

namespace urifetch {

namespace {

using color_row = std::array<std::string_view, kNumTermColors>;

// indexed by termstyle, then termcolor
constexpr std::array<color_row, kNumTermStyles> ansi_colors{{
    {"\033[0m", "\033[31m", "\033[33m", "\033[35m", "\033[36m", "\033[90m"},
    {"\033[0m", "\033[1;31m", "\033[1;33m", "\033[1;35m", "\033[1;36m",
     "\033[1;90m"},
    {"\033[0m", "\033[2;31m", "\033[2;33m", "\033[2;35m", "\033[2;36m",
     "\033[2;90m"},
}};

} // namespace

bool terminal_ansi::is_tty(std::ostream& os) const {
  if (&os == &std::cout) {
    return ::isatty(::fileno(stdout));
  }
  if (&os == &std::cerr) {
    return ::isatty(::fileno(stderr));
  }
  return false;
}

bool terminal_ansi::is_fancy() const {
  if (auto term = ::getenv("TERM")) {
    std::string_view term_sv(term);
    return !term_sv.empty() && term_sv != "dumb";
  }
  return false;
}

std::string_view terminal_ansi::color(termcolor color, termstyle style) const {
  return ansi_colors.at(static_cast<size_t>(style))
      .at(static_cast<size_t>(color));
}

bool terminal_ansi::set_echo(std::istream& is, bool enable) const {
  if (&is != &std::cin || !::isatty(STDIN_FILENO)) {
    return true;
  }

  struct ::termios tio;

  if (::tcgetattr(STDIN_FILENO, &tio) != 0) {
    return true;
  }

  bool const previous = (tio.c_lflag & ECHO) != 0;

  if (enable) {
    tio.c_lflag |= ECHO;
  } else {
    tio.c_lflag &= ~ECHO;
  }

  if (::tcsetattr(STDIN_FILENO, TCSANOW, &tio) != 0) {
    return true;
  }

  return previous;
}

} // namespace urifetch
