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

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <archive.h>

#include <fmt/format.h>

#include <boost/version.hpp>
#include <nlohmann/json.hpp>
#include <range/v3/version.hpp>

#include <urifetch/library_dependencies.h>

namespace urifetch {

namespace {

std::string version_to_string(uint64_t version, version_format fmt) {
  switch (fmt) {
  case version_format::maj_min_patch_dec_100:
    return fmt::format("{}.{}.{}", version / 10000, (version / 100) % 100,
                       version % 100);
  case version_format::boost:
    return fmt::format("{}.{}.{}", version / 100000, (version / 100) % 1000,
                       version % 100);
  case version_format::libarchive:
    return fmt::format("{}.{}.{}", version / 1000000, (version / 1000) % 1000,
                       version % 1000);
  }

  throw std::invalid_argument("unsupported version format");
}

} // namespace

void library_dependencies::add_library(std::string_view name,
                                       std::string_view version) {
  deps_.insert(fmt::format("{}-{}", name, version));
}

void library_dependencies::add_library(std::string_view name,
                                       uint64_t version, version_format fmt) {
  add_library(name, version_to_string(version, fmt));
}

void library_dependencies::add_common_libraries() {
  add_library("fmt", FMT_VERSION, version_format::maj_min_patch_dec_100);
  add_library("boost", BOOST_VERSION, version_format::boost);
  add_library("archive", ::archive_version_number(),
              version_format::libarchive);
  add_library("nlohmann-json",
              fmt::format("{}.{}.{}", NLOHMANN_JSON_VERSION_MAJOR,
                          NLOHMANN_JSON_VERSION_MINOR,
                          NLOHMANN_JSON_VERSION_PATCH));
  add_library("range-v3", fmt::format("{}.{}.{}", RANGE_V3_MAJOR,
                                      RANGE_V3_MINOR, RANGE_V3_PATCHLEVEL));
}

std::string library_dependencies::as_string() const {
  static constexpr size_t width{80};
  static constexpr std::string_view prefix{"using: "};
  std::string rv{prefix};
  size_t col = prefix.size();

  for (auto const& dep : deps_) {
    if (col > prefix.size()) {
      if (col + dep.size() + 2 > width) {
        rv += ",\n";
        rv.append(prefix.size(), ' ');
        col = prefix.size();
      } else {
        rv += ", ";
        col += 2;
      }
    }
    rv += dep;
    col += dep.size();
  }

  return rv;
}

} // namespace urifetch
