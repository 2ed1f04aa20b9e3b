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

#include <cstdlib>
#include <iostream>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include <urifetch/command_driver.h>
#include <urifetch/driver_registry.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/logger.h>
#include <urifetch/string.h>

namespace urifetch {

transfer_result
driver::submit_form(uri const&, form_fields const&, std::filesystem::path const&,
                    transfer_context const&) {
  return transfer_result::failure(
      kStatusFatal,
      fmt::format("driver '{}' does not support form submission", name()));
}

driver_factory_registry& driver_factory_registry::instance() {
  static driver_factory_registry the_instance;
  return the_instance;
}

void driver_factory_registry::register_factory(
    driver_type type, std::unique_ptr<driver_factory const>&& factory) {
  auto name = factory->name();

  if (!factories_.emplace(type, std::move(factory)).second) {
    std::cerr << "driver factory type conflict (" << name << ", "
              << static_cast<int>(type) << ")\n";
    ::abort();
  }
}

void driver_factory_registry::for_each_factory(
    std::function<void(driver_type, driver_factory const&)> const& fn) const {
  auto types = factories_ | ranges::views::keys | ranges::to<std::vector>;

  ranges::sort(types);

  for (auto type : types) {
    fn(type, *factories_.at(type));
  }
}

template <driver_type Type>
void driver_factory_registry::do_register() {
  register_factory(Type, detail::driver_registrar<Type>::reg());
}

driver_factory_registry::driver_factory_registry() {
  using enum driver_type;

  do_register<LOCAL>();
  do_register<CURL>();
  do_register<SCP>();
  do_register<S3>();
  do_register<GSIFTP>();
  do_register<HDFS>();
}

namespace internal {

namespace {

using nlj = nlohmann::json;

command_driver_definition
parse_definition(std::string const& scheme, nlj const& def) {
  command_driver_definition rv;

  rv.scheme = to_lower(scheme);

  if (!def.is_object()) {
    URIFETCH_THROW(runtime_error,
                   fmt::format("driver '{}': definition must be an object",
                               scheme));
  }

  auto cmd = def.find("command");

  if (cmd == def.end() || !cmd->is_array() || cmd->empty()) {
    URIFETCH_THROW(runtime_error,
                   fmt::format("driver '{}': 'command' must be a non-empty "
                               "array of strings",
                               scheme));
  }

  rv.command = cmd->get<std::vector<std::string>>();
  rv.description = def.value("description", std::string{});
  rv.retry_in_adapter = def.value("retry_in_adapter", false);

  if (auto it = def.find("not_found_exit_codes"); it != def.end()) {
    for (auto const& code : *it) {
      rv.not_found_exit_codes.insert(code.get<int>());
    }
  }

  if (auto it = def.find("env"); it != def.end()) {
    for (auto const& [key, value] : it->items()) {
      rv.env.emplace(key, value.get<std::string>());
    }
  }

  return rv;
}

} // namespace

template <typename LoggerPolicy>
class driver_registry_ final : public driver_registry::impl {
 public:
  explicit driver_registry_(logger& lgr)
      : LOG_PROXY_INIT(lgr)
      , lgr_{lgr} {
    driver_factory_registry::instance().for_each_factory(
        [this](driver_type, driver_factory const& df) {
          std::shared_ptr<driver> drv = df.create(lgr_);
          for (auto const& scheme : drv->schemes()) {
            drivers_[scheme] = drv;
          }
        });
  }

  driver& resolve(std::string_view scheme) const override {
    auto it = drivers_.find(to_lower(scheme));

    if (it == drivers_.end()) {
      URIFETCH_THROW(no_driver_error, scheme);
    }

    return *it->second;
  }

  bool has_driver(std::string_view scheme) const override {
    return drivers_.contains(to_lower(scheme));
  }

  void add(std::string_view scheme, std::shared_ptr<driver> drv) override {
    auto key = to_lower(scheme);

    if (auto it = drivers_.find(key); it != drivers_.end()) {
      LOG_VERBOSE << "driver '" << drv->name() << "' replaces driver '"
                  << it->second->name() << "' for scheme " << key;
      it->second = std::move(drv);
    } else {
      LOG_DEBUG << "adding driver '" << drv->name() << "' for scheme " << key;
      drivers_.emplace(std::move(key), std::move(drv));
    }
  }

  void load_definitions(file_access const& fa,
                        std::filesystem::path const& path) override {
    load_definitions(fa.read_file(path), path.string());
  }

  void load_definitions(std::string_view json,
                        std::string_view origin) override {
    nlj doc;

    try {
      doc = nlj::parse(json);
    } catch (nlj::exception const& e) {
      URIFETCH_THROW(runtime_error,
                     fmt::format("invalid driver definitions in {}: {}",
                                 origin, e.what()));
    }

    auto drivers = doc.find("drivers");

    if (!doc.is_object() || drivers == doc.end() || !drivers->is_object()) {
      URIFETCH_THROW(runtime_error,
                     fmt::format("{}: expected a 'drivers' object", origin));
    }

    for (auto const& [scheme, def] : drivers->items()) {
      command_driver_definition cdd;

      try {
        cdd = parse_definition(scheme, def);
      } catch (nlj::exception const& e) {
        URIFETCH_THROW(runtime_error,
                       fmt::format("{}: driver '{}': {}", origin, scheme,
                                   e.what()));
      }

      LOG_DEBUG << "loaded driver '" << cdd.scheme << "' from " << origin;

      auto key = cdd.scheme;
      add(key, create_command_driver(lgr_, std::move(cdd)));
    }
  }

  void for_each_driver(
      std::function<void(std::string const&, driver const&)> const& fn)
      const override {
    auto schemes = drivers_ | ranges::views::keys | ranges::to<std::vector>;

    ranges::sort(schemes);

    for (auto const& scheme : schemes) {
      fn(scheme, *drivers_.at(scheme));
    }
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
  logger& lgr_;
  std::unordered_map<std::string, std::shared_ptr<driver>> drivers_;
};

} // namespace internal

driver_registry::driver_registry(logger& lgr)
    : impl_{make_unique_logging_object<impl, internal::driver_registry_,
                                       logger_policies>(lgr)} {}

} // namespace urifetch
