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

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace urifetch {

class logger;

struct command_line {
  std::vector<std::string> args;
  std::map<std::string, std::string> env{};
  std::optional<std::filesystem::path> working_dir{};
  // written to the standard input of the process, which is closed otherwise
  std::optional<std::string> input{};
  // replaced by `***` in to_string()
  std::vector<std::string> redact{};

  std::string to_string() const;
};

struct process_result {
  int exit_code{0};
  std::string out{};
  std::string err{};
  bool killed{false};
};

// Launches the external programs of a driver invocation. Every process
// runs in a process group owned by this object so that cancel() can take
// down the whole tree.
class job_control {
 public:
  virtual ~job_control() = default;

  virtual process_result run(command_line const& cmd) = 0;
  virtual void cancel() = 0;
  virtual bool cancelled() const = 0;
};

std::shared_ptr<job_control> create_process_job_control(logger& lgr);

} // namespace urifetch
