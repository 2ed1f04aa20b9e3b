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
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <urifetch/credential_store.h>
#include <urifetch/transfer_result.h>

namespace urifetch {

class glob_matcher;
class job_control;
class logger;
class os_access;
class uri;
struct run_options;

// Everything a driver may consult during one invocation.
struct transfer_context {
  run_options const& options;
  job_control& jobs;
  os_access const& os;
  std::filesystem::path cookie_jar{};
  std::optional<credential> cred{};
  glob_matcher const* exclude{nullptr};
};

using form_fields = std::vector<std::pair<std::string, std::string>>;

class driver_info {
 public:
  virtual ~driver_info() = default;

  virtual std::string_view name() const = 0;
  virtual std::string_view description() const = 0;
  virtual std::vector<std::string> schemes() const = 0;
  // external programs this driver delegates to
  virtual std::set<std::string> tools() const = 0;
};

class driver : public driver_info {
 public:
  virtual transfer_result transfer(uri const& src,
                                   std::filesystem::path const& dest,
                                   transfer_context const& ctx) = 0;

  // Posts `fields` to `endpoint` and stores the response in `dest`.
  virtual transfer_result submit_form(uri const& endpoint,
                                      form_fields const& fields,
                                      std::filesystem::path const& dest,
                                      transfer_context const& ctx);
};

class driver_factory : public driver_info {
 public:
  virtual std::unique_ptr<driver> create(logger& lgr) const = 0;
};

enum class driver_type {
  LOCAL,
  CURL,
  SCP,
  S3,
  GSIFTP,
  HDFS,
};

namespace detail {

template <driver_type Type>
struct driver_registrar;

#define URIFETCH_DETAIL_DRIVER_REGISTRAR_(name)                                \
  template <>                                                                  \
  struct driver_registrar<driver_type::name> {                                 \
    static std::unique_ptr<driver_factory> reg();                              \
  }

URIFETCH_DETAIL_DRIVER_REGISTRAR_(LOCAL);
URIFETCH_DETAIL_DRIVER_REGISTRAR_(CURL);
URIFETCH_DETAIL_DRIVER_REGISTRAR_(SCP);
URIFETCH_DETAIL_DRIVER_REGISTRAR_(S3);
URIFETCH_DETAIL_DRIVER_REGISTRAR_(GSIFTP);
URIFETCH_DETAIL_DRIVER_REGISTRAR_(HDFS);

#undef URIFETCH_DETAIL_DRIVER_REGISTRAR_

} // namespace detail

} // namespace urifetch

#define REGISTER_DRIVER_FACTORY(factory)                                       \
  std::unique_ptr<urifetch::driver_factory>                                    \
  urifetch::detail::driver_registrar<factory::type>::reg() {                   \
    return std::make_unique<factory>();                                        \
  }
