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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace urifetch {

class uri {
 public:
  uri() = default;

  // Throws runtime_error if `str` is not an absolute URI.
  static uri parse(std::string_view str);

  // Accepts both absolute URIs and bare local paths; the latter are
  // turned into `file://` URIs, made absolute against `cwd`.
  static uri from_input(std::string_view str, std::filesystem::path const& cwd);

  static bool looks_like_uri(std::string_view str);

  std::string const& str() const { return text_; }
  std::string const& scheme() const { return scheme_; }
  std::string driver_name() const;

  bool has_authority() const { return has_authority_; }
  std::string const& authority() const { return authority_; }
  std::string const& user() const { return user_; }
  std::string const& password() const { return password_; }
  std::string const& host() const { return host_; }
  std::optional<uint16_t> port() const { return port_; }
  std::string const& path() const { return path_; }
  std::string const& query() const { return query_; }
  std::string const& fragment() const { return fragment_; }

  // `host[:port]`, the key used by the credential store.
  std::string index_key() const;

  // Last path segment (query stripped, percent-decoded), falling back to
  // `index.html` for directory-like URIs.
  std::string filename() const;

  // Trailing path segment with query and fragment stripped, used to
  // de-duplicate discovered references.
  std::string trailing_segment() const;

  bool is_local() const { return scheme_ == "file"; }
  std::filesystem::path local_path() const;

  uri with_suffix(std::string_view suffix) const;

  // RFC 3986 reference resolution against this URI.
  uri resolve(std::string_view ref) const;

  bool operator==(uri const& rhs) const { return text_ == rhs.text_; }

 private:
  std::string text_;
  std::string scheme_;
  bool has_authority_{false};
  std::string authority_;
  std::string user_;
  std::string password_;
  std::string host_;
  std::optional<uint16_t> port_;
  std::string path_;
  std::string query_;
  std::string fragment_;
};

std::string percent_decode(std::string_view str);
std::string percent_encode(std::string_view str);

} // namespace urifetch
