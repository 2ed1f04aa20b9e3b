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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <urifetch/driver.h>
#include <urifetch/transfer_result.h>

namespace urifetch {

class credential_manager;
class file_access;
class local_artifact;
class logger;
class os_access;
class uri;

// Only artifacts smaller than this are inspected for further references.
inline constexpr std::uintmax_t kLinkFollowMaxSize{100 * 1024};

enum class content_class {
  NONE,
  INDIRECTION_LIST,
  RESOURCE_LISTING,
  HYPERTEXT,
  LOGIN_PAGE,
};

std::string_view content_class_name(content_class cc);

// Sends a login form through the driver of the endpoint's scheme.
class form_submitter {
 public:
  virtual ~form_submitter() = default;

  virtual transfer_result
  submit(uri const& endpoint, form_fields const& fields,
         std::filesystem::path const& dest, credential const& cred) = 0;
};

struct link_follow_outcome {
  enum class action {
    // artifact is kept and processed further
    KEEP,
    // artifact was consumed, `discovered` goes to the front of the queue
    FOLLOW,
    // artifact was consumed, the same URI has to be fetched again
    REQUEUE,
    // `result` holds the failure
    FAILED,
  };

  action act{action::KEEP};
  content_class kind{content_class::NONE};
  std::vector<std::string> discovered{};
  transfer_result result{};
};

class link_follower {
 public:
  link_follower(logger& lgr, file_access const& fa, os_access const& os,
                credential_manager& creds, form_submitter& forms);

  link_follow_outcome follow(uri const& current, local_artifact& artifact) {
    return impl_->follow(current, artifact);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual link_follow_outcome
    follow(uri const& current, local_artifact& artifact) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

namespace detail {

struct login_form {
  std::string action;
  std::string user_field{"username"};
  std::string password_field{"password"};
  form_fields hidden{};
};

struct meta_refresh {
  std::chrono::seconds delay{0};
  std::string target{};
};

content_class classify_content(std::string_view content,
                               std::string_view filename);

std::vector<std::string> indirection_list(std::string_view content);

// Values of all `attr="..."` attributes of `tag` elements (or of any
// element if `tag` is empty), in document order.
std::vector<std::string>
attribute_values(std::string_view content, std::string_view tag,
                 std::string_view attr);

std::optional<meta_refresh> find_meta_refresh(std::string_view content);

std::optional<login_form> find_login_form(std::string_view content);

// Resolves `refs` against `base`, dropping fragments, queries, mail and
// script links, parent directories and duplicate trailing segments.
std::vector<std::string>
resolve_references(uri const& base, std::vector<std::string> const& refs);

} // namespace detail

} // namespace urifetch
