/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of urifetch.
 *
 * urifetch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * urifetch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with urifetch.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <optional>

#include <fmt/format.h>

#include <urifetch/library_dependencies.h>
#include <urifetch/logger.h>
#include <urifetch/tool/tool.h>

#ifndef URIFETCH_VERSION
#define URIFETCH_VERSION "unknown"
#endif

namespace po = boost::program_options;

namespace boost {

void validate(boost::any& v, std::vector<std::string> const&,
              std::optional<bool>*, int) {
  po::validators::check_first_occurrence(v);
  v = std::make_optional(true);
}

} // namespace boost

namespace urifetch::tool {

std::string tool_header(std::string_view tool_name) {
  library_dependencies deps;
  deps.add_common_libraries();

  return fmt::format("{} ({})\nfetch anything that has a URI\n\n{}\n\n",
                     tool_name, URIFETCH_VERSION, deps.as_string());
}

void add_common_options(po::options_description& opts,
                        logger_options& logopts) {
  auto log_level_desc = "log level (" + logger::all_level_names() + ")";

  // clang-format off
  opts.add_options()
    ("log-level",
        po::value<logger::level_type>(&logopts.threshold)
            ->default_value(logger::INFO),
        log_level_desc.c_str())
    ("log-with-context",
        po::value<std::optional<bool>>(&logopts.with_context)->zero_tokens(),
        "enable context logging regardless of level")
    ("help,h",
        "output help message and exit")
    ;
  // clang-format on
}

} // namespace urifetch::tool
