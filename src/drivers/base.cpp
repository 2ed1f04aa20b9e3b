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
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

#include <urifetch/glob_matcher.h>
#include <urifetch/string.h>

#include "base.h"

namespace urifetch::drivers {

namespace fs = std::filesystem;

namespace {

constexpr int kStatusLocalCopyFailed{2};
constexpr size_t kCopyChunkSize{1 << 20};

transfer_result copy_failed(fs::path const& path, std::error_code const& ec) {
  return transfer_result::failure(
      kStatusLocalCopyFailed,
      fmt::format("cannot copy {}: {}", path.string(), ec.message()));
}

transfer_result copy_cancelled(fs::path const& path) {
  return transfer_result::failure(
      kStatusAborted, fmt::format("copy of {} cancelled", path.string()));
}

// Copies file data in chunks so that a cancelled job stops between them.
// Returns false if the copy was cancelled.
bool copy_file_data(fs::path const& src, fs::path const& dest,
                    job_control const& jobs, std::error_code& ec) {
  std::ifstream in(src, std::ios::binary);

  if (!in) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    return true;
  }

  std::ofstream out(dest, std::ios::binary | std::ios::trunc);

  if (!out) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    return true;
  }

  std::vector<char> buf(kCopyChunkSize);

  while (in) {
    if (jobs.cancelled()) {
      return false;
    }

    in.read(buf.data(), buf.size());

    if (auto n = in.gcount(); n > 0) {
      out.write(buf.data(), n);
    }

    if (!out) {
      ec = std::make_error_code(std::errc::io_error);
      return true;
    }
  }

  if (in.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return true;
  }

  out.close();

  if (!out) {
    ec = std::make_error_code(std::errc::io_error);
    return true;
  }

  if (auto st = fs::status(src, ec); !ec) {
    fs::permissions(dest, st.permissions(), ec);
  }

  return true;
}

} // namespace

int status_from_exit_code(int exit_code) {
  if (exit_code == 0) {
    return kStatusSuccess;
  }
  if (exit_code == 1 || exit_code < 0) {
    return 2;
  }
  return std::min(exit_code, 127);
}

bool is_retryable(int status) { return status >= 2 && status <= 127; }

transfer_result result_from_process(process_result const& pr,
                                    std::string_view tool) {
  if (pr.killed) {
    return transfer_result::failure(kStatusTimeout,
                                    fmt::format("{} was terminated", tool));
  }

  auto status = status_from_exit_code(pr.exit_code);

  if (status == kStatusSuccess) {
    return transfer_result::success();
  }

  auto msg = std::string(trim(pr.err));

  if (msg.empty()) {
    msg = fmt::format("{} exited with code {}", tool, pr.exit_code);
  }

  return transfer_result::failure(status, std::move(msg));
}

void remove_partial(fs::path const& dest) {
  std::error_code ec;
  if (fs::exists(fs::symlink_status(dest, ec))) {
    fs::remove_all(dest, ec);
  }
}

std::string seconds_arg(std::chrono::seconds s) {
  return std::to_string(s.count());
}

transfer_result copy_local(logger& lgr, fs::path const& src,
                           fs::path const& dest, transfer_context const& ctx) {
  LOG_PROXY(prod_logger_policy, lgr);

  std::error_code ec;
  auto st = fs::symlink_status(src, ec);

  if (ec || !fs::exists(st)) {
    return transfer_result::failure(
        kStatusNotFound, fmt::format("{}: no such file", src.string()));
  }

  if (!ctx.options.copy_physical) {
    LOG_DEBUG << "linking " << dest.string() << " -> " << src.string();

    if (fs::is_directory(src, ec)) {
      fs::create_directory_symlink(src, dest, ec);
    } else {
      fs::create_symlink(src, dest, ec);
    }

    if (ec) {
      return copy_failed(src, ec);
    }

    return transfer_result::success();
  }

  if (!fs::is_directory(src, ec)) {
    LOG_DEBUG << "copying " << src.string() << " to " << dest.string();

    if (!copy_file_data(src, dest, ctx.jobs, ec)) {
      return copy_cancelled(src);
    }

    if (ec) {
      return copy_failed(src, ec);
    }

    return transfer_result::success();
  }

  LOG_DEBUG << "copying directory " << src.string() << " to " << dest.string();

  fs::create_directories(dest, ec);

  if (ec) {
    return copy_failed(dest, ec);
  }

  for (auto it = fs::recursive_directory_iterator(src, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ctx.jobs.cancelled()) {
      return copy_cancelled(src);
    }

    auto const rel = it->path().lexically_relative(src);

    if (ctx.exclude && ctx.exclude->match(rel.generic_string())) {
      LOG_VERBOSE << "excluding " << rel.string();
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }

    auto const target = dest / rel;

    if (it->is_symlink()) {
      fs::copy_symlink(it->path(), target, ec);
    } else if (it->is_directory()) {
      fs::create_directories(target, ec);
    } else if (!copy_file_data(it->path(), target, ctx.jobs, ec)) {
      return copy_cancelled(src);
    }

    if (ec) {
      return copy_failed(it->path(), ec);
    }
  }

  if (ec) {
    return copy_failed(src, ec);
  }

  return transfer_result::success();
}

} // namespace urifetch::drivers
