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
#include <functional>
#include <memory>

#include <urifetch/transfer_result.h>

namespace urifetch {

class job_control;
class logger;

// Runs a driver call with a hard wall-clock bound. On expiry, or when a
// termination signal arrives, every process group launched through the
// job control of the call is killed and the call reports kStatusTimeout
// (or kStatusAborted).
class watchdog {
 public:
  using job_factory = std::function<std::shared_ptr<job_control>()>;
  using supervised_fn = std::function<transfer_result(job_control&)>;

  static constexpr std::chrono::milliseconds kPollInterval{100};
  static constexpr std::chrono::seconds kJoinGracePeriod{5};

  explicit watchdog(logger& lgr);
  watchdog(logger& lgr, job_factory jobs);

  transfer_result
  supervise(std::chrono::milliseconds timeout, supervised_fn fn) {
    return impl_->supervise(timeout, std::move(fn));
  }

  // Kills the in-flight call, if any. Safe to call at any time and more
  // than once.
  void cancel() { impl_->cancel(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual transfer_result
    supervise(std::chrono::milliseconds timeout, supervised_fn fn) = 0;
    virtual void cancel() = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace urifetch
