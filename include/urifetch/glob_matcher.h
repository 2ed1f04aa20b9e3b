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

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace urifetch {

// Shell-style glob matching (`*`, `?`, `[...]`, `{a,b}`). A pattern
// without a `/` is matched against the last path component only.
class glob_matcher {
 public:
  glob_matcher();
  explicit glob_matcher(std::span<std::string const> patterns);
  ~glob_matcher();

  glob_matcher(glob_matcher&&) noexcept;
  glob_matcher& operator=(glob_matcher&&) noexcept;

  void add_pattern(std::string_view pattern) { impl_->add_pattern(pattern); }

  bool empty() const { return impl_->empty(); }
  bool match(std::string_view path) const { return impl_->match(path); }
  bool operator()(std::string_view path) const { return match(path); }

  class impl {
   public:
    virtual ~impl() = default;
    virtual void add_pattern(std::string_view pattern) = 0;
    virtual bool empty() const = 0;
    virtual bool match(std::string_view path) const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

namespace detail {

std::string glob_to_regex_string(std::string_view pattern);

} // namespace detail

} // namespace urifetch
