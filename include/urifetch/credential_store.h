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

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace urifetch {

class file_access;
class logger;
class os_access;

struct credential {
  std::string user;
  std::string password;

  // Parses `user:password`; the password may itself contain colons.
  static credential parse(std::string_view str);
};

// Persists credentials as `host[:port]=username:password` lines.
class credential_store {
 public:
  credential_store(logger& lgr, file_access const& fa,
                   std::filesystem::path file, bool enabled = true);

  std::optional<credential> lookup(std::string_view index) const {
    return impl_->lookup(index);
  }

  // Replaces an existing entry for `index`, keeping all others.
  void store(std::string_view index, credential const& cred) {
    impl_->store(index, cred);
  }

  bool enabled() const { return impl_->enabled(); }
  std::filesystem::path const& path() const { return impl_->path(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::optional<credential>
    lookup(std::string_view index) const = 0;
    virtual void store(std::string_view index, credential const& cred) = 0;
    virtual bool enabled() const = 0;
    virtual std::filesystem::path const& path() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

// Interactive credential input, injected so non-interactive callers can
// substitute their own.
class credential_prompt {
 public:
  virtual ~credential_prompt() = default;

  virtual std::optional<credential> ask(std::string_view index) = 0;
  virtual bool confirm_save(std::string_view index) = 0;
};

class session_store {
 public:
  static constexpr std::string_view kDiscardJar{"/dev/null"};

  session_store(std::filesystem::path jar, bool private_mode)
      : jar_{private_mode ? std::filesystem::path{kDiscardJar}
                          : std::move(jar)}
      , private_{private_mode} {}

  std::filesystem::path const& cookie_jar() const { return jar_; }
  bool is_private() const { return private_; }

 private:
  std::filesystem::path jar_;
  bool private_;
};

struct credential_options {
  std::optional<credential> explicit_credential{};
  bool private_mode{false};
  bool quiet{false};
};

class credential_manager {
 public:
  credential_manager(logger& lgr, credential_store& store,
                     credential_options const& opts,
                     credential_prompt* prompt = nullptr);

  std::optional<credential>
  load_credentials(std::string_view index, bool mandatory) {
    return impl_->load_credentials(index, mandatory);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::optional<credential>
    load_credentials(std::string_view index, bool mandatory) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

// `$URIFETCH_CONFIG_DIR`, or `$HOME/.urifetch`.
std::filesystem::path default_config_dir(os_access const& os);

} // namespace urifetch
