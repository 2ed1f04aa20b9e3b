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

#include <atomic>
#include <cerrno>
#include <clocale>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <locale>
#include <mutex>

#include <fmt/format.h>

#include <folly/ExceptionString.h>
#include <folly/String.h>

#include <urifetch/conv.h>
#include <urifetch/error.h>
#include <urifetch/util.h>

namespace urifetch {

namespace {

inline std::string trimmed(std::string in) {
  while (!in.empty() && in.back() == ' ') {
    in.pop_back();
  }
  return in;
}

std::atomic<int> g_termination_signal{-1};
std::once_flag g_termination_handlers_installed;

static_assert(std::atomic<int>::is_always_lock_free);

extern "C" void termination_signal_handler(int signum) {
  g_termination_signal.store(signum, std::memory_order_relaxed);
}

void install_termination_handlers_impl() {
  for (int signum : {SIGINT, SIGTERM, SIGHUP}) {
    struct ::sigaction new_sa{};
    // this is potentially implemented as a macro
    sigfillset(&new_sa.sa_mask);
    new_sa.sa_handler = termination_signal_handler;
    if (::sigaction(signum, &new_sa, nullptr) != 0) {
      URIFETCH_THROW(system_error,
                     fmt::format("sigaction({})", ::strsignal(signum)));
    }
  }
}

} // namespace

std::string size_with_unit(std::uint64_t size) {
  return trimmed(folly::prettyPrint(size, folly::PRETTY_BYTES_IEC, true));
}

std::string time_with_unit(double sec) {
  return trimmed(folly::prettyPrint(sec, folly::PRETTY_TIME_HMS, false));
}

std::string time_with_unit(std::chrono::nanoseconds ns) {
  return time_with_unit(1e-9 * ns.count());
}

bool getenv_is_enabled(char const* var) {
  if (auto val = std::getenv(var)) {
    if (auto maybeBool = try_to<bool>(val); maybeBool && *maybeBool) {
      return true;
    }
  }
  return false;
}

void setup_default_locale() {
  try {
    std::locale::global(std::locale(""));
    if (!std::setlocale(LC_ALL, "")) {
      std::cerr << "warning: setlocale(LC_ALL, \"\") failed\n";
    }
  } catch (std::exception const& e) {
    std::cerr << "warning: failed to set user default locale: " << e.what()
              << "\n";
    try {
      std::locale::global(std::locale::classic());
      if (!std::setlocale(LC_ALL, "C")) {
        std::cerr << "warning: setlocale(LC_ALL, \"C\") failed\n";
      }
    } catch (std::exception const& e) {
      std::cerr << "warning: also failed to set classic locale: " << e.what()
                << "\n";
    }
  }
}

std::string_view basename(std::string_view path) {
  auto pos = path.find_last_of('/');
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

std::string exception_str(std::exception const& e) {
  return folly::exceptionStr(e).toStdString();
}

std::string exception_str(std::exception_ptr const& e) {
  return folly::exceptionStr(e).toStdString();
}

std::tm safe_localtime(std::time_t t) {
  std::tm buf{};
  if (!::localtime_r(&t, &buf)) {
    URIFETCH_THROW(runtime_error,
                   fmt::format("localtime_r: error code {}", errno));
  }
  return buf;
}

void install_termination_handlers() {
  std::call_once(g_termination_handlers_installed,
                 install_termination_handlers_impl);
}

bool termination_requested() noexcept {
  return g_termination_signal.load(std::memory_order_relaxed) >= 0;
}

int termination_signal() noexcept {
  return g_termination_signal.load(std::memory_order_relaxed);
}

void request_termination(int signum) noexcept {
  g_termination_signal.store(signum, std::memory_order_relaxed);
}

void reset_termination_request() noexcept {
  g_termination_signal.store(-1, std::memory_order_relaxed);
}

} // namespace urifetch
