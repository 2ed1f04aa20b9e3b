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
#include <memory>
#include <string_view>

namespace urifetch {

class file_access;
class local_artifact;
class logger;

enum class archive_action { NONE, GUNZIP, UNTAR, UNZIP, GZIP, TAR };

std::string_view archive_action_name(archive_action action);

// Post-transfer unpacking and packing of artifacts. All failures are
// reported as archive_error.
class archive_transform {
 public:
  archive_transform(logger& lgr, file_access const& fa);

  // What uncompress() would do with a file called `name`.
  static archive_action uncompress_action(std::string_view name);

  // What compress() would do with a file (or directory) called `name`.
  static archive_action compress_action(std::string_view name, bool is_dir);

  // `.gz` is decompressed in place, `.tgz`/`.tar.gz` is extracted into
  // `output_dir` and `.zip` into a directory named after the archive; a
  // single top level entry replaces that directory.
  archive_action
  uncompress(local_artifact& artifact, std::filesystem::path const& output_dir) {
    return impl_->uncompress(artifact, output_dir);
  }

  // Directories become `.tgz`, files `.gz`, unless already compressed.
  archive_action compress(local_artifact& artifact) {
    return impl_->compress(artifact);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual archive_action uncompress(local_artifact& artifact,
                                      std::filesystem::path const& output_dir) = 0;
    virtual archive_action compress(local_artifact& artifact) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace urifetch
