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

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <urifetch/driver.h>
#include <urifetch/job_control.h>
#include <urifetch/logger.h>
#include <urifetch/os_access.h>
#include <urifetch/run_options.h>
#include <urifetch/transfer_result.h>
#include <urifetch/util.h>

namespace urifetch::drivers {

// Exit codes of external tools are mapped into the driver status range:
// 0 stays 0, 1 becomes 2 (tools use 1 for generic failures, which must
// not trigger the not-found fallback), anything above 127 is capped.
int status_from_exit_code(int exit_code);

bool is_retryable(int status);

transfer_result result_from_process(process_result const& pr,
                                    std::string_view tool);

// Removes whatever a failed attempt left behind at `dest`.
void remove_partial(std::filesystem::path const& dest);

std::string seconds_arg(std::chrono::seconds s);

// Copies (or links, unless copy_physical is set) a local file or
// directory tree.
transfer_result copy_local(logger& lgr, std::filesystem::path const& src,
                           std::filesystem::path const& dest,
                           transfer_context const& ctx);

// Drivers whose tools have no retry logic of their own repeat retryable
// failures here.
template <typename LoggerPolicy, typename Attempt>
transfer_result
retry_in_adapter(log_proxy<LoggerPolicy> const& log_, std::string_view what,
                 transfer_context const& ctx, Attempt&& attempt) {
  auto const& opts = ctx.options;

  for (size_t n = 0;; ++n) {
    auto rv = attempt();

    if (!is_retryable(rv.status) || n >= opts.retries ||
        ctx.jobs.cancelled()) {
      return rv;
    }

    LOG_WARN << what << " failed with status " << rv.status << " ("
             << rv.message << "), retrying in "
             << time_with_unit(opts.retry_delay) << " [" << (n + 1) << "/"
             << opts.retries << "]";

    ctx.os.sleep_for(opts.retry_delay);
  }
}

} // namespace urifetch::drivers
