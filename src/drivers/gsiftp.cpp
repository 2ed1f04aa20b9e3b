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

#include <array>

#include <urifetch/uri.h>

#include "base.h"

namespace urifetch {

namespace {

constexpr std::array<std::string_view, 4> kCertificateVariables{
    "X509_USER_PROXY", "X509_USER_CERT", "X509_USER_KEY",
    "X509_CERT_DIR"};

template <typename Base>
class gsiftp_driver_info : public Base {
 public:
  static constexpr driver_type type{driver_type::GSIFTP};

  std::string_view name() const override { return "gsiftp"; }

  std::string_view description() const override {
    return "GridFTP transfers using globus-url-copy (X.509 certificates)";
  }

  std::vector<std::string> schemes() const override { return {"gsiftp"}; }

  std::set<std::string> tools() const override { return {"globus-url-copy"}; }
};

template <typename LoggerPolicy>
class gsiftp_driver final : public gsiftp_driver_info<driver> {
 public:
  explicit gsiftp_driver(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    command_line cmd{{"globus-url-copy", "-cd"}};
    auto const& opts = ctx.options;

    if (opts.retries > 0) {
      cmd.args.insert(cmd.args.end(),
                      {"-rst", "-rst-retries", std::to_string(opts.retries),
                       "-rst-interval", drivers::seconds_arg(opts.retry_delay)});
    }

    if (opts.timeout.count() > 0) {
      cmd.args.insert(cmd.args.end(),
                      {"-stall-timeout", drivers::seconds_arg(opts.timeout)});
    }

    if (src.path().ends_with('/')) {
      cmd.args.push_back("-r");
    }

    bool have_certificate = false;

    for (auto var : kCertificateVariables) {
      if (auto value = ctx.os.getenv(var)) {
        cmd.env.emplace(std::string(var), *value);
        have_certificate = true;
      }
    }

    if (!have_certificate) {
      LOG_VERBOSE << "no X509_USER_* variables set, relying on the default "
                     "proxy certificate location";
    }

    auto target = std::filesystem::absolute(dest);
    auto target_uri = fmt::format("file://{}{}", target.generic_string(),
                                  src.path().ends_with('/') ? "/" : "");

    cmd.args.insert(cmd.args.end(), {src.str(), target_uri});

    auto pr = ctx.jobs.run(cmd);

    if (pr.exit_code == 0 || pr.killed) {
      return drivers::result_from_process(pr, "globus-url-copy");
    }

    drivers::remove_partial(dest);

    if (pr.err.find("No such file") != std::string::npos ||
        pr.err.find("not found") != std::string::npos) {
      return transfer_result::failure(
          kStatusNotFound, fmt::format("{}: not found", src.str()));
    }

    return drivers::result_from_process(pr, "globus-url-copy");
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

class gsiftp_driver_factory final : public gsiftp_driver_info<driver_factory> {
 public:
  std::unique_ptr<driver> create(logger& lgr) const override {
    return make_unique_logging_object<driver, gsiftp_driver, logger_policies>(
        lgr);
  }
};

} // namespace

REGISTER_DRIVER_FACTORY(gsiftp_driver_factory)

} // namespace urifetch
