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

#include <algorithm>
#include <atomic>
#include <future>
#include <list>
#include <mutex>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#if __has_include(<boost/process/v1/args.hpp>)
#define BOOST_PROCESS_VERSION 1
#include <boost/process/v1/args.hpp>
#include <boost/process/v1/async.hpp>
#include <boost/process/v1/child.hpp>
#include <boost/process/v1/environment.hpp>
#include <boost/process/v1/exception.hpp>
#include <boost/process/v1/group.hpp>
#include <boost/process/v1/io.hpp>
#include <boost/process/v1/search_path.hpp>
#include <boost/process/v1/start_dir.hpp>
#else
#include <boost/process.hpp>
#endif

#include <urifetch/job_control.h>
#include <urifetch/logger.h>
#include <urifetch/transfer_result.h>

namespace urifetch {

namespace bp = boost::process;

namespace {

constexpr int kExitCommandNotFound{127};

std::string shell_quote(std::string_view arg) {
  if (!arg.empty() &&
      arg.find_first_of(" \t\n'\"\\$`*?[]{}()<>|&;!#~") ==
          std::string_view::npos) {
    return std::string(arg);
  }
  std::string rv{"'"};
  for (char c : arg) {
    if (c == '\'') {
      rv += "'\\''";
    } else {
      rv += c;
    }
  }
  rv += '\'';
  return rv;
}

} // namespace

std::string command_line::to_string() const {
  std::vector<std::string> quoted;
  quoted.reserve(args.size());
  for (auto const& a : args) {
    auto s = a;
    for (auto const& r : redact) {
      if (r.empty()) {
        continue;
      }
      for (auto pos = s.find(r); pos != std::string::npos;
           pos = s.find(r, pos + 3)) {
        s.replace(pos, r.size(), "***");
      }
    }
    quoted.push_back(shell_quote(s));
  }
  return fmt::format("{}", fmt::join(quoted, " "));
}

namespace internal {

template <typename LoggerPolicy>
class process_job_control_ final : public job_control {
 public:
  explicit process_job_control_(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  process_result run(command_line const& cmd) override {
    if (cmd.args.empty()) {
      return {kExitCommandNotFound, {}, "empty command line"};
    }

    auto exe = resolve_executable(cmd.args.front());

    if (exe.empty()) {
      LOG_DEBUG << "command not found: " << cmd.args.front();
      return {kExitCommandNotFound, {},
              fmt::format("{}: command not found", cmd.args.front())};
    }

    std::vector<std::string> args(cmd.args.begin() + 1, cmd.args.end());
    bp::environment env = boost::this_process::environment();

    for (auto const& [name, value] : cmd.env) {
      env[name] = value;
    }

    auto const start_dir =
        cmd.working_dir ? *cmd.working_dir : std::filesystem::current_path();

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    bp::group grp;
    bp::child proc;

    LOG_DEBUG << "running: " << cmd.to_string();

    {
      std::lock_guard lock(mx_);

      if (cancelled_) {
        return {kStatusTimeout, {}, "job control already cancelled", true};
      }

      auto launch = [&](auto&& std_in) {
        return bp::child(exe.string(), bp::args(args),
                         std::forward<decltype(std_in)>(std_in),
                         bp::std_out > out, bp::std_err > err, env,
                         bp::start_dir = start_dir.string(), grp, ios);
      };

      try {
        if (cmd.input) {
          proc = launch(bp::std_in < boost::asio::buffer(*cmd.input));
        } else {
          proc = launch(bp::std_in.close());
        }
      } catch (bp::process_error const& e) {
        LOG_DEBUG << "failed to launch " << exe.string() << ": " << e.what();
        return {kExitCommandNotFound, {},
                fmt::format("failed to launch {}: {}", exe.string(),
                            e.what())};
      }

      active_.push_back(&grp);
    }

    ios.run();
    proc.wait();

    process_result rv;
    rv.out = out.get();
    rv.err = err.get();
    rv.exit_code = proc.exit_code();

    {
      std::lock_guard lock(mx_);
      active_.remove(&grp);
      rv.killed = cancelled_;
    }

    if (rv.killed) {
      rv.exit_code = kStatusTimeout;
    }

    LOG_TRACE << "exit code " << rv.exit_code << " from "
              << cmd.args.front();

    return rv;
  }

  void cancel() override {
    std::lock_guard lock(mx_);

    if (!cancelled_) {
      LOG_DEBUG << "cancelling " << active_.size() << " process group(s)";
    }

    cancelled_ = true;

    for (auto* grp : active_) {
      std::error_code ec;
      grp->terminate(ec);
      if (ec) {
        LOG_TRACE << "terminating process group: " << ec.message();
      }
    }
  }

  bool cancelled() const override {
    std::lock_guard lock(mx_);
    return cancelled_;
  }

 private:
  static std::filesystem::path resolve_executable(std::string const& name) {
    if (name.find('/') != std::string::npos) {
      return name;
    }
    return bp::search_path(name).string();
  }

  LOG_PROXY_DECL(LoggerPolicy);
  std::mutex mutable mx_;
  bool cancelled_{false};
  std::list<bp::group*> active_;
};

} // namespace internal

std::shared_ptr<job_control> create_process_job_control(logger& lgr) {
  return make_shared_logging_object<job_control,
                                    internal::process_job_control_,
                                    logger_policies>(lgr);
}

} // namespace urifetch
