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

#include <optional>

#include <urifetch/command_driver.h>
#include <urifetch/string.h>
#include <urifetch/uri.h>

#include "base.h"

namespace urifetch {

namespace internal {

namespace {

template <typename LoggerPolicy>
class command_driver_ final : public driver {
 public:
  command_driver_(logger& lgr, command_driver_definition def)
      : LOG_PROXY_INIT(lgr)
      , def_{std::move(def)}
      , tool_{def_.command.empty() ? std::string{} : def_.command.front()} {}

  std::string_view name() const override { return def_.scheme; }

  std::string_view description() const override {
    return def_.description.empty() ? std::string_view{"user defined driver"}
                                    : std::string_view{def_.description};
  }

  std::vector<std::string> schemes() const override { return {def_.scheme}; }

  std::set<std::string> tools() const override {
    if (tool_.empty()) {
      return {};
    }
    return {tool_};
  }

  transfer_result transfer(uri const& src, std::filesystem::path const& dest,
                           transfer_context const& ctx) override {
    auto cmd = build_command(src, dest, ctx);

    LOG_DEBUG << "[" << def_.scheme << "] " << cmd.to_string();

    auto attempt = [&] {
      auto pr = ctx.jobs.run(cmd);

      if (pr.exit_code != 0 && !pr.killed) {
        drivers::remove_partial(dest);

        if (def_.not_found_exit_codes.contains(pr.exit_code)) {
          return transfer_result::failure(
              kStatusNotFound, fmt::format("{}: not found", src.str()));
        }
      }

      return drivers::result_from_process(pr, tool_);
    };

    if (def_.retry_in_adapter) {
      return drivers::retry_in_adapter(log_, tool_, ctx, attempt);
    }

    return attempt();
  }

 private:
  command_line build_command(uri const& src, std::filesystem::path const& dest,
                             transfer_context const& ctx) const {
    auto const& opts = ctx.options;
    std::string user = src.user();
    std::string password = src.password();

    if (ctx.cred) {
      user = ctx.cred->user;
      password = ctx.cred->password;
    }

    auto lookup = [&](std::string_view name) -> std::optional<std::string> {
      if (name == "uri") {
        return src.str();
      }
      if (name == "dest") {
        return dest.string();
      }
      if (name == "user") {
        return user;
      }
      if (name == "password") {
        return password;
      }
      if (name == "retries") {
        return std::to_string(opts.retries);
      }
      if (name == "retry_delay") {
        return drivers::seconds_arg(opts.retry_delay);
      }
      if (name == "connect_timeout") {
        return drivers::seconds_arg(opts.timeout);
      }
      if (name == "cookie_jar") {
        return ctx.cookie_jar.string();
      }
      return std::nullopt;
    };

    command_line cmd;

    for (auto const& arg : def_.command) {
      cmd.args.push_back(expand_placeholders(arg, lookup));
    }

    for (auto const& [key, value] : def_.env) {
      cmd.env.emplace(key, expand_placeholders(value, lookup));
    }

    if (!password.empty()) {
      cmd.redact.push_back(password);
    }

    return cmd;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  command_driver_definition const def_;
  std::string const tool_;
};

} // namespace

} // namespace internal

std::unique_ptr<driver>
create_command_driver(logger& lgr, command_driver_definition def) {
  return make_unique_logging_object<driver, internal::command_driver_,
                                    logger_policies>(lgr, std::move(def));
}

} // namespace urifetch
