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
class s3_driver_info : public Base {
 public:
  static constexpr driver_type type{driver_type::S3};

  std::string_view name() const override { return "s3"; }

  std::string_view description() const override {
    return "object storage transfers using the AWS command line interface";
  }

  std::vector<std::string> schemes() const override { return {"s3"}; }

  std::set<std::string> tools() const override { return {"aws"}; }
};

template <typename LoggerPolicy>
class s3_driver final : public s3_driver_info<driver> {
 public:
  explicit s3_driver(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    command_line cmd{{"aws", "s3", "cp", "--only-show-errors"}};
    auto const& opts = ctx.options;

    if (opts.timeout.count() > 0) {
      cmd.args.insert(cmd.args.end(), {"--cli-connect-timeout",
                                       drivers::seconds_arg(opts.timeout)});
    }

    // a trailing slash denotes a prefix ("directory") in the bucket
    if (src.path().ends_with('/')) {
      cmd.args.push_back("--recursive");
    }

    cmd.args.insert(cmd.args.end(), {src.str(), dest.string()});

    return drivers::retry_in_adapter(log_, "aws s3 cp", ctx, [&] {
      auto pr = ctx.jobs.run(cmd);

      if (pr.exit_code == 0 || pr.killed) {
        return drivers::result_from_process(pr, "aws");
      }

      drivers::remove_partial(dest);

      if (pr.err.find("(404)") != std::string::npos ||
          pr.err.find("does not exist") != std::string::npos ||
          pr.err.find("NoSuchKey") != std::string::npos) {
        return transfer_result::failure(
            kStatusNotFound, fmt::format("{}: not found", src.str()));
      }

      return drivers::result_from_process(pr, "aws");
    });
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

class s3_driver_factory final : public s3_driver_info<driver_factory> {
 public:
  std::unique_ptr<driver> create(logger& lgr) const override {
    return make_unique_logging_object<driver, s3_driver, logger_policies>(
        lgr);
  }
};

} // namespace

REGISTER_DRIVER_FACTORY(s3_driver_factory)

} // namespace urifetch
