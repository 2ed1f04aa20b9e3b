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
#include <future>
#include <mutex>
#include <optional>
#include <thread>

#include <fmt/format.h>

#include <urifetch/job_control.h>
#include <urifetch/logger.h>
#include <urifetch/util.h>
#include <urifetch/watchdog.h>

namespace urifetch {

namespace internal {

template <typename LoggerPolicy>
class watchdog_ final : public watchdog::impl {
 public:
  watchdog_(logger& lgr, watchdog::job_factory jobs)
      : LOG_PROXY_INIT(lgr)
      , jobs_{std::move(jobs)} {}

  transfer_result supervise(std::chrono::milliseconds timeout,
                            watchdog::supervised_fn fn) override {
    using clock = std::chrono::steady_clock;

    auto jobs = jobs_();

    {
      std::lock_guard lock(mx_);
      current_ = jobs;
    }

    auto promise = std::make_shared<std::promise<transfer_result>>();
    auto future = promise->get_future();

    std::thread worker([promise, jobs, fn = std::move(fn)] {
      try {
        promise->set_value(fn(*jobs));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    });

    std::optional<clock::time_point> deadline;

    if (timeout.count() > 0) {
      deadline = clock::now() + timeout;
    }

    std::optional<transfer_result> forced;

    for (;;) {
      auto wait = std::chrono::duration_cast<clock::duration>(
          watchdog::kPollInterval);

      if (deadline) {
        wait = std::clamp<clock::duration>(*deadline - clock::now(),
                                           clock::duration::zero(), wait);
      }

      if (future.wait_for(wait) == std::future_status::ready) {
        break;
      }

      if (termination_requested()) {
        forced = transfer_result::failure(kStatusAborted,
                                          "aborted by termination signal");
        break;
      }

      if (deadline && clock::now() >= *deadline) {
        forced = transfer_result::failure(
            kStatusTimeout,
            fmt::format("timed out after {}", time_with_unit(timeout)));
        break;
      }
    }

    if (forced) {
      LOG_WARN << forced->message << ", terminating driver processes";

      jobs->cancel();

      if (future.wait_for(watchdog::kJoinGracePeriod) ==
          std::future_status::ready) {
        worker.join();
      } else {
        LOG_ERROR << "driver call did not return within "
                  << time_with_unit(watchdog::kJoinGracePeriod)
                  << " after cancellation, abandoning it";
        worker.detach();
      }

      reset_current();

      return *forced;
    }

    worker.join();
    reset_current();

    return future.get();
  }

  void cancel() override {
    std::lock_guard lock(mx_);
    if (current_) {
      current_->cancel();
    }
  }

 private:
  void reset_current() {
    std::lock_guard lock(mx_);
    current_.reset();
  }

  LOG_PROXY_DECL(LoggerPolicy);
  watchdog::job_factory jobs_;
  std::mutex mx_;
  std::shared_ptr<job_control> current_;
};

} // namespace internal

watchdog::watchdog(logger& lgr)
    : watchdog(lgr, [&lgr] { return create_process_job_control(lgr); }) {}

watchdog::watchdog(logger& lgr, job_factory jobs)
    : impl_{make_unique_logging_object<impl, internal::watchdog_,
                                       logger_policies>(lgr,
                                                        std::move(jobs))} {}

} // namespace urifetch
