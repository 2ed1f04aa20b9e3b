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

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>

#include <fmt/format.h>

#include <folly/portability/Unistd.h>

#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/file_access_generic.h>

namespace urifetch {

namespace fs = std::filesystem;

namespace {

std::error_code last_error() { return {errno, std::generic_category()}; }

template <typename Stream, typename Base>
class file_stream : public Base {
 public:
  file_stream(fs::path const& path, std::ios_base::openmode mode,
              std::error_code& ec)
      : s_{path, mode} {
    ec.clear();
    if (!s_.is_open() || s_.fail()) {
      ec = last_error();
    }
  }

  void close(std::error_code& ec) override {
    s_.close();
    if (s_.bad() || s_.fail()) {
      ec = last_error();
    }
  }

 protected:
  Stream s_;
};

class file_input_stream : public file_stream<std::ifstream, input_stream> {
 public:
  using file_stream::file_stream;

  std::istream& is() override { return s_; }
};

class file_output_stream : public file_stream<std::ofstream, output_stream> {
 public:
  using file_stream::file_stream;

  std::ostream& os() override { return s_; }
};

template <typename T>
std::unique_ptr<T> unless_failed(std::unique_ptr<T> s, std::error_code& ec) {
  if (ec) {
    s.reset();
  }
  return s;
}

class file_access_generic : public file_access {
 public:
  bool exists(fs::path const& path) const override {
    std::error_code ec;
    return fs::exists(path, ec);
  }

  std::unique_ptr<input_stream>
  open_input(fs::path const& path, std::error_code& ec) const override {
    return unless_failed<input_stream>(
        std::make_unique<file_input_stream>(path, std::ios::in, ec), ec);
  }

  std::unique_ptr<output_stream>
  open_output(fs::path const& path, std::error_code& ec) const override {
    return unless_failed<output_stream>(
        std::make_unique<file_output_stream>(
            path, std::ios::out | std::ios::trunc, ec),
        ec);
  }

  std::unique_ptr<output_stream>
  open_output_private(fs::path const& path,
                      std::error_code& ec) const override {
    ec.clear();
    auto fd = ::open(path.string().c_str(), O_WRONLY | O_CREAT | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (fd < 0) {
      ec = last_error();
      return nullptr;
    }
    ::close(fd);

    // the file may have existed with wider permissions
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, ec);
    if (ec) {
      return nullptr;
    }

    return open_output(path, ec);
  }
};

} // namespace

void output_stream::close() {
  std::error_code ec;
  close(ec);
  if (ec) {
    URIFETCH_THROW(system_error, "close", ec.value());
  }
}

std::string file_access::read_file(fs::path const& path) const {
  std::error_code ec;
  auto in = open_input(path, ec);

  if (ec) {
    URIFETCH_THROW(system_error, fmt::format("cannot read {}", path.string()),
                   ec.value());
  }

  std::ostringstream oss;
  oss << in->is().rdbuf();
  in->close(ec);

  if (ec) {
    URIFETCH_THROW(system_error, fmt::format("cannot read {}", path.string()),
                   ec.value());
  }

  return oss.str();
}

std::unique_ptr<file_access const> create_file_access_generic() {
  return std::make_unique<file_access_generic>();
}

} // namespace urifetch
