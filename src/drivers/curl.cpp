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

#include <urifetch/conv.h>
#include <urifetch/string.h>
#include <urifetch/uri.h>

#include "base.h"

namespace urifetch {

namespace {

// curl: "HTTP page not retrieved" (with --fail) and "resource given in the
// URL does not exist"
constexpr int kCurlHttpError{22};
constexpr int kCurlRemoteFileNotFound{78};

bool is_http_not_found(int http_code) {
  return http_code == 404 || http_code == 410;
}

template <typename Base>
class curl_driver_info : public Base {
 public:
  static constexpr driver_type type{driver_type::CURL};

  std::string_view name() const override { return "curl"; }

  std::string_view description() const override {
    return "HTTP(S) and FTP(S) transfers using curl";
  }

  std::vector<std::string> schemes() const override {
    return {"http", "https", "ftp", "ftps"};
  }

  std::set<std::string> tools() const override { return {"curl"}; }
};

template <typename LoggerPolicy>
class curl_driver final : public curl_driver_info<driver> {
 public:
  explicit curl_driver(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    auto cmd = base_command(src, ctx);
    auto const& opts = ctx.options;

    if (opts.retries > 0) {
      cmd.args.insert(cmd.args.end(),
                      {"--retry", std::to_string(opts.retries),
                       "--retry-delay", drivers::seconds_arg(opts.retry_delay)});
    }

    cmd.args.insert(cmd.args.end(), {"-o", dest.string(), src.str()});

    return run(cmd, src, dest, ctx);
  }

  transfer_result submit_form(uri const& endpoint, form_fields const& fields,
                              std::filesystem::path const& dest,
                              transfer_context const& ctx) override {
    auto cmd = base_command(endpoint, ctx);

    for (auto const& [key, value] : fields) {
      add_config(cmd, "data-urlencode", fmt::format("{}={}", key, value));
    }

    cmd.args.insert(cmd.args.end(), {"-o", dest.string(), endpoint.str()});

    LOG_VERBOSE << "submitting login form to " << endpoint.str();

    return run(cmd, endpoint, dest, ctx);
  }

 private:
  command_line base_command(uri const& src, transfer_context const& ctx) const {
    command_line cmd{{"curl", "-L", "-f", "-sS", "-w", "%{http_code}"}};
    auto const& opts = ctx.options;

    if (opts.timeout.count() > 0) {
      cmd.args.insert(cmd.args.end(), {"--connect-timeout",
                                       drivers::seconds_arg(opts.timeout)});
    }

    auto const scheme = src.driver_name();

    if ((scheme == "http" || scheme == "https") && !ctx.cookie_jar.empty()) {
      cmd.args.insert(cmd.args.end(), {"-b", ctx.cookie_jar.string(), "-c",
                                       ctx.cookie_jar.string()});
    }

    if (ctx.cred && !ctx.cred->user.empty()) {
      add_config(cmd, "user",
                 fmt::format("{}:{}", ctx.cred->user, ctx.cred->password));
    }

    if (opts.tmpdir) {
      cmd.env.emplace("TMPDIR", opts.tmpdir->string());
    }

    return cmd;
  }

  // Secrets are passed in a config read from stdin (`-K -`) so they never
  // show up in the process list.
  static void add_config(command_line& cmd, std::string_view option,
                         std::string_view value) {
    if (!cmd.input) {
      cmd.input.emplace();
      cmd.args.insert(cmd.args.end(), {"-K", "-"});
    }
    *cmd.input += fmt::format("{} = \"{}\"\n", option, config_quote(value));
  }

  static std::string config_quote(std::string_view value) {
    std::string rv;
    rv.reserve(value.size());
    for (char c : value) {
      switch (c) {
      case '"':
      case '\\':
        rv += '\\';
        rv += c;
        break;
      case '\n':
        rv += "\\n";
        break;
      case '\r':
        rv += "\\r";
        break;
      case '\t':
        rv += "\\t";
        break;
      default:
        rv += c;
      }
    }
    return rv;
  }

  transfer_result run(command_line const& cmd, uri const& src,
                      std::filesystem::path const& dest,
                      transfer_context const& ctx) {
    auto pr = ctx.jobs.run(cmd);

    if (pr.killed) {
      drivers::remove_partial(dest);
      return drivers::result_from_process(pr, "curl");
    }

    auto http_code = try_to<int>(std::string(trim(pr.out))).value_or(0);

    LOG_DEBUG << "curl exit code " << pr.exit_code << ", response code "
              << http_code << " for " << src.str();

    if (pr.exit_code == 0) {
      return transfer_result::success();
    }

    drivers::remove_partial(dest);

    if ((pr.exit_code == kCurlHttpError && is_http_not_found(http_code)) ||
        pr.exit_code == kCurlRemoteFileNotFound) {
      return transfer_result::failure(
          kStatusNotFound, fmt::format("{}: not found", src.str()));
    }

    return drivers::result_from_process(pr, "curl");
  }

  LOG_PROXY_DECL(LoggerPolicy);
};

class curl_driver_factory final : public curl_driver_info<driver_factory> {
 public:
  std::unique_ptr<driver> create(logger& lgr) const override {
    return make_unique_logging_object<driver, curl_driver, logger_policies>(
        lgr);
  }
};

} // namespace

REGISTER_DRIVER_FACTORY(curl_driver_factory)

} // namespace urifetch
