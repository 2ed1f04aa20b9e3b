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

#include <fstream>
#include <sstream>
#include <vector>

#include <fmt/format.h>

#include <urifetch/credential_store.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/logger.h>
#include <urifetch/os_access.h>
#include <urifetch/string.h>

namespace urifetch {

namespace internal {

namespace {

struct credential_line {
  std::string index;
  credential cred;
};

std::optional<credential_line> parse_line(std::string_view line) {
  line = trim(line);

  if (line.empty() || line.starts_with('#')) {
    return std::nullopt;
  }

  auto eq = line.find('=');

  if (eq == std::string_view::npos) {
    return std::nullopt;
  }

  return credential_line{std::string(trim(line.substr(0, eq))),
                         credential::parse(line.substr(eq + 1))};
}

} // namespace

template <typename LoggerPolicy>
class credential_store_ final : public credential_store::impl {
 public:
  credential_store_(logger& lgr, file_access const& fa,
                    std::filesystem::path file, bool enabled)
      : LOG_PROXY_INIT(lgr)
      , fa_{fa}
      , file_{std::move(file)}
      , enabled_{enabled} {}

  std::optional<credential> lookup(std::string_view index) const override {
    if (!enabled_) {
      return std::nullopt;
    }

    for (auto const& line : read_lines()) {
      if (auto entry = parse_line(line); entry && entry->index == index) {
        LOG_DEBUG << "found stored credentials for " << index;
        return entry->cred;
      }
    }

    return std::nullopt;
  }

  void store(std::string_view index, credential const& cred) override {
    if (!enabled_) {
      LOG_DEBUG << "credential store disabled, not saving " << index;
      return;
    }

    std::vector<std::string> lines;

    for (auto& line : read_lines()) {
      if (auto entry = parse_line(line); entry && entry->index == index) {
        continue;
      }
      lines.push_back(std::move(line));
    }

    lines.push_back(fmt::format("{}={}:{}", index, cred.user, cred.password));

    std::error_code ec;

    if (file_.has_parent_path()) {
      std::filesystem::create_directories(file_.parent_path(), ec);
      // errors surface when opening the file
    }

    auto os = fa_.open_output_private(file_, ec);

    if (ec) {
      URIFETCH_THROW(system_error,
                     fmt::format("cannot write credentials to {}",
                                 file_.string()),
                     ec.value());
    }

    for (auto const& line : lines) {
      os->os() << line << '\n';
    }

    os->close();

    LOG_VERBOSE << "saved credentials for " << index << " to "
                << file_.string();
  }

  bool enabled() const override { return enabled_; }

  std::filesystem::path const& path() const override { return file_; }

 private:
  std::vector<std::string> read_lines() const {
    std::vector<std::string> lines;
    std::error_code ec;

    if (!fa_.exists(file_)) {
      return lines;
    }

    auto is = fa_.open_input(file_, ec);

    if (ec) {
      LOG_WARN << "cannot read credentials from " << file_.string() << ": "
               << ec.message();
      return lines;
    }

    std::string line;
    while (std::getline(is->is(), line)) {
      lines.push_back(line);
    }

    return lines;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  file_access const& fa_;
  std::filesystem::path const file_;
  bool const enabled_;
};

template <typename LoggerPolicy>
class credential_manager_ final : public credential_manager::impl {
 public:
  credential_manager_(logger& lgr, credential_store& store,
                      credential_options const& opts,
                      credential_prompt* prompt)
      : LOG_PROXY_INIT(lgr)
      , store_{store}
      , opts_{opts}
      , prompt_{prompt} {}

  std::optional<credential>
  load_credentials(std::string_view index, bool mandatory) override {
    if (opts_.explicit_credential) {
      if (!opts_.private_mode) {
        store_.store(index, *opts_.explicit_credential);
      }
      return opts_.explicit_credential;
    }

    if (opts_.private_mode) {
      return std::nullopt;
    }

    if (auto cred = store_.lookup(index)) {
      return cred;
    }

    if (!mandatory || opts_.quiet || !prompt_) {
      if (mandatory) {
        LOG_WARN << "no credentials available for " << index;
      }
      return std::nullopt;
    }

    auto cred = prompt_->ask(index);

    if (!cred) {
      return std::nullopt;
    }

    if (store_.enabled() && prompt_->confirm_save(index)) {
      store_.store(index, *cred);
    }

    return cred;
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
  credential_store& store_;
  credential_options const opts_;
  credential_prompt* prompt_;
};

} // namespace internal

credential credential::parse(std::string_view str) {
  credential rv;
  if (auto colon = str.find(':'); colon != std::string_view::npos) {
    rv.user = std::string(str.substr(0, colon));
    rv.password = std::string(str.substr(colon + 1));
  } else {
    rv.user = std::string(str);
  }
  return rv;
}

credential_store::credential_store(logger& lgr, file_access const& fa,
                                   std::filesystem::path file, bool enabled)
    : impl_{make_unique_logging_object<impl, internal::credential_store_,
                                       logger_policies>(
          lgr, fa, std::move(file), enabled)} {}

credential_manager::credential_manager(logger& lgr, credential_store& store,
                                       credential_options const& opts,
                                       credential_prompt* prompt)
    : impl_{make_unique_logging_object<impl, internal::credential_manager_,
                                       logger_policies>(lgr, store, opts,
                                                        prompt)} {}

std::filesystem::path default_config_dir(os_access const& os) {
  if (auto dir = os.getenv("URIFETCH_CONFIG_DIR"); dir && !dir->empty()) {
    return *dir;
  }

  if (auto home = os.getenv("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".urifetch";
  }

  return os.current_path() / ".urifetch";
}

} // namespace urifetch
