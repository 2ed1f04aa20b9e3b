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

#include <vector>

#include <urifetch/tool/iolayer.h>
#include <urifetch/tool/main_adapter.h>
#include <urifetch/tool/safe_main.h>

namespace urifetch::tool {

namespace {

template <typename T>
int call_main_iolayer(std::span<T> args, iolayer const& iol,
                      main_adapter::main_fn_type main_fn) {
  std::vector<std::string> argv;
  std::vector<char*> argv_ptrs;
  argv.reserve(args.size());
  argv_ptrs.reserve(args.size() + 1);
  for (auto const& arg : args) {
    argv.emplace_back(arg);
    argv_ptrs.emplace_back(argv.back().data());
  }
  argv_ptrs.emplace_back(nullptr);
  return main_fn(static_cast<int>(args.size()), argv_ptrs.data(), iol);
}

} // namespace

main_adapter::main_adapter(main_fn_type main_fn)
    : main_fn_(main_fn) {}

int main_adapter::operator()(int argc, char** argv) const {
  return main_fn_(argc, argv, iolayer::system_default());
}

int main_adapter::operator()(std::span<std::string const> args,
                             iolayer const& iol) const {
  return call_main_iolayer(args, iol, main_fn_);
}

int main_adapter::operator()(std::span<std::string_view const> args,
                             iolayer const& iol) const {
  return call_main_iolayer(args, iol, main_fn_);
}

int main_adapter::safe(int argc, char** argv) const {
  return safe_main([&] { return (*this)(argc, argv); });
}

int main_adapter::safe(std::span<std::string const> args,
                       iolayer const& iol) const {
  return safe_main([&] { return (*this)(args, iol); });
}

} // namespace urifetch::tool
