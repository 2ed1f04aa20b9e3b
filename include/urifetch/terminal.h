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

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace urifetch {

enum class termcolor : size_t { NORMAL, RED, YELLOW, MAGENTA, CYAN, GRAY };
enum class termstyle : size_t { NORMAL, BOLD, DIM };

inline constexpr size_t kNumTermColors{6};
inline constexpr size_t kNumTermStyles{3};

class terminal {
 public:
  virtual ~terminal() = default;

  virtual bool is_tty(std::ostream& os) const = 0;
  virtual bool is_fancy() const = 0;
  virtual std::string_view
  color(termcolor color, termstyle style = termstyle::NORMAL) const = 0;

  // Returns the previous echo state; a no-op for streams that are not
  // attached to a terminal.
  virtual bool set_echo(std::istream& is, bool enable) const = 0;

  std::string colored(std::string_view text, termcolor fg, bool enable = true,
                      termstyle style = termstyle::NORMAL) const {
    if (!enable) {
      return std::string(text);
    }
    std::string result(color(fg, style));
    result.append(text);
    result.append(color(termcolor::NORMAL));
    return result;
  }
};

} // namespace urifetch
