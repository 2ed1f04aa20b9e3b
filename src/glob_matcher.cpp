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

#include <algorithm>
#include <regex>
#include <vector>

#include <fmt/format.h>

#include <urifetch/error.h>
#include <urifetch/glob_matcher.h>

namespace urifetch {

namespace detail {

std::string glob_to_regex_string(std::string_view pattern) {
  static constexpr std::string_view special_chars = R"(.^$|()[]{}+?*\)";

  std::string regex;
  size_t brace_depth = 0;

  for (size_t pos = 0; pos < pattern.size(); ++pos) {
    char c = pattern[pos];

    switch (c) {
    case '\\':
      if (++pos >= pattern.size()) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("trailing backslash in pattern: {}",
                                   pattern));
      }
      c = pattern[pos];
      if (special_chars.find(c) != std::string_view::npos) {
        regex += '\\';
      }
      regex += c;
      break;

    case '*':
      if (pos + 1 < pattern.size() && pattern[pos + 1] == '*') {
        ++pos;
        regex += ".*";
      } else {
        regex += "[^/]*";
      }
      break;

    case '?':
      regex += "[^/]";
      break;

    case '[': {
      auto end = pattern.find(']', pos + 2);
      if (end == std::string_view::npos) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("unmatched '[' in pattern: {}", pattern));
      }
      auto body = pattern.substr(pos + 1, end - pos - 1);
      regex += '[';
      if (body.starts_with('!')) {
        regex += '^';
        body.remove_prefix(1);
      }
      for (char bc : body) {
        if (bc == '\\' || bc == '^') {
          regex += '\\';
        }
        regex += bc;
      }
      regex += ']';
      pos = end;
    } break;

    case '{':
      ++brace_depth;
      regex += "(?:";
      break;

    case ',':
      regex += brace_depth > 0 ? "|" : ",";
      break;

    case '}':
      if (brace_depth == 0) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("unmatched '}}' in pattern: {}", pattern));
      }
      --brace_depth;
      regex += ')';
      break;

    default:
      if (special_chars.find(c) != std::string_view::npos) {
        regex += '\\';
      }
      regex += c;
      break;
    }
  }

  if (brace_depth > 0) {
    URIFETCH_THROW(runtime_error,
                   fmt::format("unmatched '{{' in pattern: {}", pattern));
  }

  return regex;
}

} // namespace detail

namespace {

struct compiled_pattern {
  std::regex re;
  bool full_path;
};

} // namespace

class glob_matcher_ final : public glob_matcher::impl {
 public:
  glob_matcher_() = default;

  explicit glob_matcher_(std::span<std::string const> patterns) {
    for (auto const& p : patterns) {
      add_pattern(p);
    }
  }

  void add_pattern(std::string_view pattern) override {
    bool const full_path = pattern.find('/') != std::string_view::npos;
    if (pattern.starts_with('/')) {
      pattern.remove_prefix(1);
    }
    m_.push_back(
        {std::regex("(?:^" + detail::glob_to_regex_string(pattern) + "$)",
                    std::regex_constants::ECMAScript |
                        std::regex_constants::optimize),
         full_path});
  }

  bool empty() const override { return m_.empty(); }

  bool match(std::string_view path) const override {
    auto name = path;
    if (auto pos = name.find_last_of('/'); pos != std::string_view::npos) {
      name.remove_prefix(pos + 1);
    }
    return std::ranges::any_of(m_, [&](auto const& p) {
      auto sv = p.full_path ? path : name;
      return std::regex_match(sv.begin(), sv.end(), p.re);
    });
  }

 private:
  std::vector<compiled_pattern> m_;
};

glob_matcher::glob_matcher()
    : impl_{std::make_unique<glob_matcher_>()} {}

glob_matcher::glob_matcher(std::span<std::string const> patterns)
    : impl_{std::make_unique<glob_matcher_>(patterns)} {}

glob_matcher::~glob_matcher() = default;

glob_matcher::glob_matcher(glob_matcher&&) noexcept = default;
glob_matcher& glob_matcher::operator=(glob_matcher&&) noexcept = default;

} // namespace urifetch
