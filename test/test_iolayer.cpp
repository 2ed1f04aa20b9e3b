/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * urifetch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * urifetch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with urifetch.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * urifetch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * urifetch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with urifetch.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <array>
#include <iostream>

#include <sstream>

#include <urifetch/file_access_generic.h>

#include "test_helpers.h"

namespace urifetch::test {

namespace {

class memory_input_stream : public input_stream {
 public:
  explicit memory_input_stream(std::string content)
      : is_{std::move(content)} {}

  std::istream& is() override { return is_; }
  void close(std::error_code& /*ec*/) override {}

 private:
  std::istringstream is_;
};

// Commits its contents to the test_file_access on close(), unless a
// close error was configured for the path.
class memory_output_stream : public output_stream {
 public:
  memory_output_stream(std::filesystem::path path, test_file_access const& tfa)
      : path_{std::move(path)}
      , tfa_{tfa} {}

  std::ostream& os() override { return os_; }

  void close(std::error_code& ec) override {
    if (auto error = tfa_.get_close_error(path_)) {
      ec = *error;
      return;
    }
    tfa_.set_file(path_, os_.str());
  }

 private:
  std::ostringstream os_;
  std::filesystem::path const path_;
  test_file_access const& tfa_;
};

} // namespace

bool test_file_access::exists(std::filesystem::path const& path) const {
  return files_.contains(path);
}

std::unique_ptr<input_stream>
test_file_access::open_input(std::filesystem::path const& path,
                             std::error_code& ec) const {
  ec.clear();
  if (auto error = get_open_error(path)) {
    ec = *error;
    return nullptr;
  }
  if (auto content = get_file(path)) {
    return std::make_unique<memory_input_stream>(std::move(*content));
  }
  ec = std::make_error_code(std::errc::no_such_file_or_directory);
  return nullptr;
}

std::unique_ptr<output_stream>
test_file_access::open_output(std::filesystem::path const& path,
                              std::error_code& ec) const {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return nullptr;
  }
  if (auto error = get_open_error(path)) {
    ec = *error;
    return nullptr;
  }
  return std::make_unique<memory_output_stream>(path, *this);
}

std::unique_ptr<output_stream>
test_file_access::open_output_private(std::filesystem::path const& path,
                                      std::error_code& ec) const {
  auto rv = open_output(path, ec);
  if (rv) {
    private_files_.insert(path);
  }
  return rv;
}

bool test_file_access::is_private(std::filesystem::path const& path) const {
  return private_files_.contains(path);
}

void test_file_access::set_file(std::filesystem::path const& path,
                                std::string content) const {
  files_[path] = std::move(content);
}

void test_file_access::set_open_error(std::filesystem::path const& path,
                                      std::error_code ec) const {
  open_errors_[path] = ec;
}

void test_file_access::set_close_error(std::filesystem::path const& path,
                                       std::error_code ec) const {
  close_errors_[path] = ec;
}

std::optional<std::error_code>
test_file_access::get_open_error(std::filesystem::path const& path) const {
  if (auto it = open_errors_.find(path); it != open_errors_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::error_code>
test_file_access::get_close_error(std::filesystem::path const& path) const {
  if (auto it = close_errors_.find(path); it != close_errors_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::string>
test_file_access::get_file(std::filesystem::path const& path) const {
  auto it = files_.find(path);
  if (it != files_.end()) {
    return it->second;
  }
  return std::nullopt;
}

test_terminal::test_terminal(std::ostream& out, std::ostream& err)
    : out_{&out}
    , err_{&err} {}

bool test_terminal::is_tty(std::ostream& /*os*/) const { return is_tty_; }

bool test_terminal::is_fancy() const { return fancy_; }

std::string_view test_terminal::color(termcolor color, termstyle style) const {
  using tag_row = std::array<std::string_view, kNumTermColors>;
  static constexpr std::array<tag_row, kNumTermStyles> tags{{
      {"<normal>", "<red>", "<yellow>", "<magenta>", "<cyan>", "<gray>"},
      {"<normal>", "<bold-red>", "<bold-yellow>", "<bold-magenta>",
       "<bold-cyan>", "<bold-gray>"},
      {"<normal>", "<dim-red>", "<dim-yellow>", "<dim-magenta>", "<dim-cyan>",
       "<dim-gray>"},
  }};

  return tags.at(static_cast<size_t>(style)).at(static_cast<size_t>(color));
}

bool test_terminal::set_echo(std::istream& /*is*/, bool enable) const {
  auto const previous = echo_;
  echo_ = enable;
  echo_changes_.push_back(enable);
  return previous;
}

test_iolayer::test_iolayer()
    : test_iolayer{os_access_mock::create_test_instance()} {}

test_iolayer::test_iolayer(std::shared_ptr<os_access const> os)
    : test_iolayer{std::move(os), create_file_access_generic()} {}

test_iolayer::test_iolayer(std::shared_ptr<os_access const> os,
                           std::shared_ptr<file_access const> fa)
    : os_{std::move(os)}
    , term_{std::make_shared<test_terminal>(out_, err_)}
    , fa_{std::move(fa)} {}

test_iolayer::~test_iolayer() = default;

tool::iolayer const& test_iolayer::get() {
  if (!iol_) {
    iol_ = std::make_unique<tool::iolayer>(tool::iolayer{
        .os = os_,
        .term = term_,
        .file = fa_,
        .in = in_,
        .out = out_,
        .err = err_,
    });
  }
  return *iol_;
}

void test_iolayer::set_terminal_is_tty(bool is_tty) {
  term_->set_is_tty(is_tty);
}
void test_iolayer::set_in(std::string in) { in_.str(std::move(in)); }

std::string test_iolayer::out() const { return out_.str(); }
std::string test_iolayer::err() const { return err_.str(); }

void test_iolayer::set_os_access(std::shared_ptr<os_access const> os) {
  if (iol_) {
    throw std::runtime_error("iolayer already created");
  }
  os_ = std::move(os);
}


} // namespace urifetch::test
