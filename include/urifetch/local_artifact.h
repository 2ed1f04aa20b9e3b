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

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace urifetch {

enum class artifact_kind { MISSING, REGULAR, DIRECTORY, SYMLINK, OTHER };

std::string_view artifact_kind_name(artifact_kind kind);

// A local path together with what was found there the last time we looked.
class local_artifact {
 public:
  local_artifact() = default;
  explicit local_artifact(std::filesystem::path path);

  std::filesystem::path const& path() const { return path_; }
  artifact_kind kind() const { return kind_; }
  std::uintmax_t size() const { return size_; }

  bool exists() const { return kind_ != artifact_kind::MISSING; }
  bool is_regular() const { return kind_ == artifact_kind::REGULAR; }
  bool is_directory() const { return kind_ == artifact_kind::DIRECTORY; }
  bool is_symlink() const { return kind_ == artifact_kind::SYMLINK; }

  // Points the artifact at a new path and observes it.
  void reset(std::filesystem::path path);

  void refresh();

  // Removes whatever is at path() (recursively for directories).
  void remove();

 private:
  std::filesystem::path path_;
  artifact_kind kind_{artifact_kind::MISSING};
  std::uintmax_t size_{0};
};

} // namespace urifetch
