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

#include <urifetch/string.h>
#include <urifetch/uri.h>

#include "base.h"

namespace urifetch {

namespace {

template <typename Base>
class scp_driver_info : public Base {
 public:
  static constexpr driver_type type{driver_type::SCP};

  std::string_view name() const override { return "scp"; }

  std::string_view description() const override {
    return "SSH transfers using scp (batch mode, key based authentication)";
  }

  std::vector<std::string> schemes() const override { return {"scp", "sftp"}; }

  std::set<std::string> tools() const override { return {"scp"}; }
};

template <typename LoggerPolicy>
class scp_driver final : public scp_driver_info<driver> {
 public:
  explicit scp_driver(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    command_line cmd{{"scp", "-B", "-q", "-r"}};
    auto const& opts = ctx.options;

    if (opts.timeout.count() > 0) {
      cmd.args.insert(cmd.args.end(),
                      {"-o", fmt::format("ConnectTimeout={}",
                                         opts.timeout.count())});
    }

    if (src.port()) {
      cmd.args.insert(cmd.args.end(), {"-P", std::to_string(*src.port())});
    }

    if (src.driver_name() == "sftp") {
      cmd.args.push_back("-s");
    }

    auto user = src.user();

    if (user.empty() && ctx.cred) {
      user = ctx.cred->user;
    }

    auto remote = fmt::format("{}:{}", src.host(), percent_decode(src.path()));

    if (!user.empty()) {
      remote = fmt::format("{}@{}", user, remote);
    }

    cmd.args.insert(cmd.args.end(), {remote, dest.string()});

    return drivers::retry_in_adapter(log_, "scp", ctx, [&] {
      auto pr = ctx.jobs.run(cmd);

      if (pr.exit_code == 0 || pr.killed) {
        return drivers::result_from_process(pr, "scp");
      }

      drivers::remove_partial(dest);

      // scp reports every remote failure with exit code 1
      if (pr.err.find("No such file") != std::string::npos ||
          pr.err.find("not found") != std::string::npos) {
        return transfer_result::failure(
            kStatusNotFound, fmt::format("{}: not found", src.str()));
      }

      return drivers::result_from_process(pr, "scp");
    });
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

class scp_driver_factory final : public scp_driver_info<driver_factory> {
 public:
  std::unique_ptr<driver> create(logger& lgr) const override {
    return make_unique_logging_object<driver, scp_driver, logger_policies>(
        lgr);
  }
};

} // namespace

REGISTER_DRIVER_FACTORY(scp_driver_factory)

} // namespace urifetch
