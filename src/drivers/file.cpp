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

#include <urifetch/uri.h>

#include "base.h"

namespace urifetch {

namespace {

template <typename Base>
class file_driver_info : public Base {
 public:
  static constexpr driver_type type{driver_type::LOCAL};

  std::string_view name() const override { return "file"; }

  std::string_view description() const override {
    return "local files and directories (copy or symbolic link)";
  }

  std::vector<std::string> schemes() const override { return {"file"}; }

  std::set<std::string> tools() const override { return {}; }
};

template <typename LoggerPolicy>
class file_driver final : public file_driver_info<driver> {
 public:
  explicit file_driver(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    if (!src.host().empty() && src.host() != "localhost") {
      return transfer_result::failure(
          kStatusFatal,
          fmt::format("remote host in file URI not supported: {}", src.str()));
    }

    return drivers::copy_local(LOG_GET_LOGGER, src.local_path(), dest, ctx);
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

class file_driver_factory final : public file_driver_info<driver_factory> {
 public:
  std::unique_ptr<driver> create(logger& lgr) const override {
    return make_unique_logging_object<driver, file_driver, logger_policies>(
        lgr);
  }
};

} // namespace

REGISTER_DRIVER_FACTORY(file_driver_factory)

} // namespace urifetch
