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

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <urifetch/transfer_result.h>

namespace urifetch {

class credential_manager;
class driver_registry;
class file_access;
class logger;
class os_access;
class session_store;
class watchdog;
class work_queue;
struct run_options;

struct run_summary {
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t skipped{0};
  std::size_t followed{0};
  std::size_t gz_fallbacks{0};
  std::vector<std::filesystem::path> reported{};
  int exit_code{kExitSuccess};
};

// The main control loop: drains a work queue one URI at a time.
class transfer_orchestrator {
 public:
  transfer_orchestrator(logger& lgr, run_options const& opts,
                        driver_registry const& drivers,
                        credential_manager& creds, session_store const& session,
                        file_access const& fa, os_access const& os,
                        watchdog& wd, std::ostream& out);

  // Processes `queue` until it is empty, the run is aborted on the first
  // failure, or a termination signal arrives.
  run_summary run(work_queue& queue) { return impl_->run(queue); }

  // Processes a single queue entry; new entries may be pushed to the front
  // of `queue`.
  transfer_result process(std::string const& input, work_queue& queue) {
    return impl_->process(input, queue);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual run_summary run(work_queue& queue) = 0;
    virtual transfer_result
    process(std::string const& input, work_queue& queue) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace urifetch
