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
#include <functional>
#include <unordered_map>
#include <memory>
#include <string>
#include <string_view>

#include <urifetch/driver.h>

namespace urifetch {

class file_access;
class library_dependencies;
class logger;

// Process-wide list of builtin driver factories.
class driver_factory_registry {
 public:
  static driver_factory_registry& instance();

  void register_factory(driver_type type,
                        std::unique_ptr<driver_factory const>&& factory);

  void for_each_factory(
      std::function<void(driver_type, driver_factory const&)> const& fn) const;

 private:
  driver_factory_registry();

  template <driver_type Type>
  void do_register();

  std::unordered_map<driver_type, std::unique_ptr<driver_factory const>>
      factories_;
};

// Scheme to driver mapping of one run: the builtin drivers plus any
// user-defined ones.
class driver_registry {
 public:
  explicit driver_registry(logger& lgr);

  // Throws no_driver_error.
  driver& resolve(std::string_view scheme) const {
    return impl_->resolve(scheme);
  }

  bool has_driver(std::string_view scheme) const {
    return impl_->has_driver(scheme);
  }

  // Later registrations for the same scheme replace earlier ones.
  void add(std::string_view scheme, std::shared_ptr<driver> drv) {
    impl_->add(scheme, std::move(drv));
  }

  // Reads user driver definitions (JSON) from `path`.
  void load_definitions(file_access const& fa,
                        std::filesystem::path const& path) {
    impl_->load_definitions(fa, path);
  }

  void load_definitions(std::string_view json, std::string_view origin) {
    impl_->load_definitions(json, origin);
  }

  // Sorted by scheme.
  void for_each_driver(
      std::function<void(std::string const&, driver const&)> const& fn) const {
    impl_->for_each_driver(fn);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual driver& resolve(std::string_view scheme) const = 0;
    virtual bool has_driver(std::string_view scheme) const = 0;
    virtual void add(std::string_view scheme, std::shared_ptr<driver> drv) = 0;
    virtual void load_definitions(file_access const& fa,
                                  std::filesystem::path const& path) = 0;
    virtual void
    load_definitions(std::string_view json, std::string_view origin) = 0;
    virtual void for_each_driver(
        std::function<void(std::string const&, driver const&)> const& fn)
        const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace urifetch
