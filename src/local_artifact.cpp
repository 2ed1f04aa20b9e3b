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

#include <system_error>

#include <fmt/format.h>

#include <urifetch/error.h>
#include <urifetch/local_artifact.h>

namespace urifetch {

namespace fs = std::filesystem;

std::string_view artifact_kind_name(artifact_kind kind) {
  switch (kind) {
  case artifact_kind::MISSING:
    return "missing";
  case artifact_kind::REGULAR:
    return "file";
  case artifact_kind::DIRECTORY:
    return "directory";
  case artifact_kind::SYMLINK:
    return "symlink";
  case artifact_kind::OTHER:
    break;
  }
  return "other";
}

local_artifact::local_artifact(fs::path path)
    : path_{std::move(path)} {
  refresh();
}

void local_artifact::reset(fs::path path) {
  path_ = std::move(path);
  refresh();
}

void local_artifact::refresh() {
  std::error_code ec;
  auto st = fs::symlink_status(path_, ec);

  size_ = 0;

  if (ec || !fs::exists(st)) {
    kind_ = artifact_kind::MISSING;
    return;
  }

  switch (st.type()) {
  case fs::file_type::regular:
    kind_ = artifact_kind::REGULAR;
    size_ = fs::file_size(path_, ec);
    if (ec) {
      size_ = 0;
    }
    break;

  case fs::file_type::directory:
    kind_ = artifact_kind::DIRECTORY;
    break;

  case fs::file_type::symlink:
    kind_ = artifact_kind::SYMLINK;
    break;

  default:
    kind_ = artifact_kind::OTHER;
    break;
  }
}

void local_artifact::remove() {
  std::error_code ec;

  fs::remove_all(path_, ec);

  if (ec) {
    URIFETCH_THROW(system_error,
                   fmt::format("cannot remove {}", path_.string()),
                   ec.value());
  }

  refresh();
}

} // namespace urifetch
