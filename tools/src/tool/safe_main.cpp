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

#include <iostream>

#include <urifetch/tool/safe_main.h>
#include <urifetch/util.h>

namespace urifetch::tool {

int safe_main(std::function<int(void)> const& fn) {
  int retval{1};
  try {
    install_termination_handlers();
    setup_default_locale();

    retval = fn();
  } catch (...) {
    std::cerr << "ERROR: " << exception_str(std::current_exception()) << "\n";
  }
  return retval;
}

} // namespace urifetch::tool
