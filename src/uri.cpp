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
#include <cctype>
#include <vector>

#include <fmt/format.h>

#include <urifetch/conv.h>
#include <urifetch/error.h>
#include <urifetch/string.h>
#include <urifetch/uri.h>

namespace urifetch {

namespace {

constexpr std::string_view kDefaultFilename{"index.html"};

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
         c == '.';
}

std::optional<size_t> scheme_length(std::string_view str) {
  if (str.empty() || !std::isalpha(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }
  for (size_t i = 1; i < str.size(); ++i) {
    if (str[i] == ':') {
      return i;
    }
    if (!is_scheme_char(str[i])) {
      break;
    }
  }
  return std::nullopt;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

std::string remove_dot_segments(std::string_view path) {
  std::vector<std::string_view> out;
  bool const absolute = path.starts_with('/');
  bool trailing = false;

  std::vector<std::string_view> segments;
  split_to(absolute ? path.substr(1) : path, '/', segments);

  for (auto seg : segments) {
    trailing = false;
    if (seg == ".") {
      trailing = true;
    } else if (seg == "..") {
      if (!out.empty()) {
        out.pop_back();
      }
      trailing = true;
    } else {
      out.push_back(seg);
    }
  }

  std::string rv = absolute ? "/" : "";
  for (size_t i = 0; i < out.size(); ++i) {
    if (i > 0) {
      rv += '/';
    }
    rv += out[i];
  }
  if (trailing && !rv.ends_with('/')) {
    rv += '/';
  }
  return rv;
}

} // namespace

std::string percent_decode(std::string_view str) {
  std::string rv;
  rv.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size()) {
      auto hi = hex_value(str[i + 1]);
      auto lo = hex_value(str[i + 2]);
      if (hi >= 0 && lo >= 0) {
        rv += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    rv += str[i];
  }
  return rv;
}

std::string percent_encode(std::string_view str) {
  std::string rv;
  rv.reserve(str.size());
  for (char c : str) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
      rv += c;
    } else {
      rv += fmt::format("%{:02X}", static_cast<unsigned>(uc));
    }
  }
  return rv;
}

bool uri::looks_like_uri(std::string_view str) {
  if (auto len = scheme_length(str)) {
    return str.substr(*len).starts_with("://");
  }
  return false;
}

uri uri::parse(std::string_view str) {
  auto const len = scheme_length(str);

  if (!len) {
    URIFETCH_THROW(runtime_error, fmt::format("invalid URI: '{}'", str));
  }

  uri u;
  u.text_ = std::string(str);
  u.scheme_ = std::string(str.substr(0, *len));

  auto rest = str.substr(*len + 1);

  if (auto pos = rest.find('#'); pos != std::string_view::npos) {
    u.fragment_ = std::string(rest.substr(pos + 1));
    rest = rest.substr(0, pos);
  }

  if (auto pos = rest.find('?'); pos != std::string_view::npos) {
    u.query_ = std::string(rest.substr(pos + 1));
    rest = rest.substr(0, pos);
  }

  if (rest.starts_with("//")) {
    rest.remove_prefix(2);
    u.has_authority_ = true;

    auto end = rest.find('/');
    auto auth = rest.substr(0, end);
    u.authority_ = std::string(auth);
    rest = end == std::string_view::npos ? std::string_view{}
                                         : rest.substr(end);

    if (auto at = auth.rfind('@'); at != std::string_view::npos) {
      auto userinfo = auth.substr(0, at);
      auth = auth.substr(at + 1);
      if (auto colon = userinfo.find(':'); colon != std::string_view::npos) {
        u.user_ = percent_decode(userinfo.substr(0, colon));
        u.password_ = percent_decode(userinfo.substr(colon + 1));
      } else {
        u.user_ = percent_decode(userinfo);
      }
    }

    std::string_view portstr;

    if (auth.starts_with('[')) {
      auto close = auth.find(']');
      if (close == std::string_view::npos) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("invalid IPv6 host in URI: '{}'", str));
      }
      u.host_ = std::string(auth.substr(0, close + 1));
      auto after = auth.substr(close + 1);
      if (after.starts_with(':')) {
        portstr = after.substr(1);
      }
    } else if (auto colon = auth.rfind(':'); colon != std::string_view::npos) {
      u.host_ = std::string(auth.substr(0, colon));
      portstr = auth.substr(colon + 1);
    } else {
      u.host_ = std::string(auth);
    }

    if (!portstr.empty()) {
      auto port = try_to<uint16_t>(portstr);
      if (!port) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("invalid port in URI: '{}'", str));
      }
      u.port_ = *port;
    }
  }

  u.path_ = std::string(rest);

  return u;
}

uri uri::from_input(std::string_view str, std::filesystem::path const& cwd) {
  str = trim(str);

  if (str.empty()) {
    URIFETCH_THROW(runtime_error, "empty URI");
  }

  if (looks_like_uri(str)) {
    return parse(str);
  }

  std::filesystem::path p{std::string(str)};

  if (p.is_relative()) {
    p = cwd / p;
  }

  auto generic = p.lexically_normal().generic_string();
  std::string encoded;

  for (char c : generic) {
    switch (c) {
    case '%':
    case '?':
    case '#':
    case ' ':
      encoded += fmt::format("%{:02X}", static_cast<unsigned char>(c));
      break;
    default:
      encoded += c;
      break;
    }
  }

  return parse("file://" + encoded);
}

std::string uri::driver_name() const { return to_lower(scheme_); }

std::string uri::index_key() const {
  if (port_) {
    return fmt::format("{}:{}", host_, *port_);
  }
  return host_;
}

std::string uri::trailing_segment() const {
  auto p = std::string_view{path_};
  if (auto pos = p.find_last_of('/'); pos != std::string_view::npos) {
    p.remove_prefix(pos + 1);
  }
  return std::string(p);
}

std::string uri::filename() const {
  auto name = percent_decode(trailing_segment());
  std::ranges::replace(name, '/', '_');
  if (name.empty() || name == "." || name == "..") {
    return std::string(kDefaultFilename);
  }
  return name;
}

std::filesystem::path uri::local_path() const {
  return std::filesystem::path{percent_decode(path_)};
}

uri uri::with_suffix(std::string_view suffix) const {
  std::string s = fmt::format("{}:", scheme_);
  if (has_authority_) {
    s += "//" + authority_;
  }
  s += path_;
  s += suffix;
  if (!query_.empty()) {
    s += '?' + query_;
  }
  if (!fragment_.empty()) {
    s += '#' + fragment_;
  }
  return parse(s);
}

uri uri::resolve(std::string_view ref) const {
  ref = trim(ref);

  if (scheme_length(ref)) {
    return parse(ref);
  }

  std::string prefix = fmt::format("{}:", scheme_);

  if (ref.starts_with("//")) {
    return parse(prefix + std::string(ref));
  }

  if (has_authority_) {
    prefix += "//" + authority_;
  }

  if (ref.empty()) {
    return parse(prefix + path_ + (query_.empty() ? "" : "?" + query_));
  }

  if (ref.starts_with('#')) {
    return parse(prefix + path_ + (query_.empty() ? "" : "?" + query_) +
                 std::string(ref));
  }

  if (ref.starts_with('?')) {
    return parse(prefix + path_ + std::string(ref));
  }

  std::string_view refpath = ref;
  std::string_view tail;

  if (auto pos = refpath.find_first_of("?#"); pos != std::string_view::npos) {
    tail = refpath.substr(pos);
    refpath = refpath.substr(0, pos);
  }

  std::string merged;

  if (refpath.starts_with('/')) {
    merged = std::string(refpath);
  } else {
    auto base = std::string_view{path_};
    if (auto pos = base.find_last_of('/'); pos != std::string_view::npos) {
      merged = std::string(base.substr(0, pos + 1));
    } else if (has_authority_) {
      merged = "/";
    }
    merged += refpath;
  }

  return parse(prefix + remove_dot_segments(merged) + std::string(tail));
}

} // namespace urifetch
