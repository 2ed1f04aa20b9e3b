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

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <urifetch/credential_store.h>
#include <urifetch/driver_registry.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/logger.h>
#include <urifetch/os_access.h>
#include <urifetch/run_options.h>
#include <urifetch/string.h>
#include <urifetch/terminal.h>
#include <urifetch/tool/iolayer.h>
#include <urifetch/tool/tool.h>
#include <urifetch/transfer_orchestrator.h>
#include <urifetch/transfer_result.h>
#include <urifetch/util.h>
#include <urifetch/watchdog.h>
#include <urifetch/work_queue.h>
#include <urifetch_tool_main.h>

namespace urifetch::tool {

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kCredentialsFile{"credentials"};
constexpr std::string_view kCookieJarFile{"cookies.txt"};

class terminal_prompt final : public credential_prompt {
 public:
  explicit terminal_prompt(iolayer const& iol)
      : iol_{iol} {}

  std::optional<credential> ask(std::string_view index) override {
    credential cred;

    iol_.err << "username for " << index << ": ";
    iol_.err.flush();

    if (!std::getline(iol_.in, cred.user) || trim(cred.user).empty()) {
      return std::nullopt;
    }

    iol_.err << "password for " << cred.user << "@" << index << ": ";
    iol_.err.flush();

    auto const echo = iol_.term->set_echo(iol_.in, false);
    bool const ok = static_cast<bool>(std::getline(iol_.in, cred.password));
    iol_.term->set_echo(iol_.in, echo);
    iol_.err << "\n";

    if (!ok) {
      return std::nullopt;
    }

    cred.user = std::string(trim(cred.user));

    return cred;
  }

  bool confirm_save(std::string_view index) override {
    iol_.err << "save credentials for " << index
             << " (stored in plain text)? [y/N] ";
    iol_.err.flush();

    std::string answer;

    if (!std::getline(iol_.in, answer)) {
      return false;
    }

    answer = to_lower(trim(answer));

    return answer == "y" || answer == "yes";
  }

 private:
  iolayer const& iol_;
};

void read_uri_list(std::istream& is, std::vector<std::string>& uris) {
  std::string line;

  while (std::getline(is, line)) {
    auto const l = trim(line);
    if (!l.empty() && !l.starts_with('#')) {
      uris.emplace_back(l);
    }
  }
}

void list_drivers(driver_registry const& registry, iolayer const& iol) {
  registry.for_each_driver([&](std::string const& scheme, driver const& drv) {
    std::string missing;

    for (auto const& tool : drv.tools()) {
      if (iol.os->find_executable(tool).empty()) {
        missing += missing.empty() ? tool : ", " + tool;
      }
    }

    iol.out << fmt::format("{:<10} {:<8} {}", scheme, drv.name(),
                           drv.description());

    if (!missing.empty()) {
      iol.out << " " << iol.term->colored(fmt::format("[missing: {}]", missing),
                                          termcolor::RED,
                                          iol.term->is_fancy() &&
                                              iol.term->is_tty(iol.out));
    }

    iol.out << "\n";
  });
}

} // namespace

int urifetch_main(int argc, char** argv, iolayer const& iol) {
  std::vector<std::string> uris;
  std::vector<std::string> exclude;
  std::string input_file, drivers_file, output_dir, overwrite_dir, prefix,
      tmpdir, user;
  size_t retries{0};
  size_t retry_delay{0};
  size_t timeout{0};
  logger_options logopts;
  run_options opts;
  bool create_output_dir{false};
  bool no_retry{false};
  bool no_follow{false};
  bool no_uncompress{false};

  // clang-format off
  po::options_description opts_desc("Command line options");
  opts_desc.add_options()
    ("abort-on-error,a",
        po::value<bool>(&opts.abort_on_error)->zero_tokens(),
        "abort on first failed URI")
    ("quiet,q",
        po::value<bool>(&opts.quiet)->zero_tokens(),
        "do not print resulting paths, never prompt")
    ("copy,c",
        po::value<bool>(&opts.copy_physical)->zero_tokens(),
        "copy local resources instead of linking them")
    ("input,i",
        po::value<std::string>(&input_file),
        "read URIs from file, one per line (- for stdin)")
    ("drivers",
        po::value<std::string>(&drivers_file),
        "load additional driver definitions (JSON)")
    ("output,o",
        po::value<std::string>(&output_dir),
        "output directory")
    ("output-overwrite,O",
        po::value<std::string>(&overwrite_dir),
        "output directory, overwrite existing files")
    ("mkdir,m",
        po::value<bool>(&create_output_dir)->zero_tokens(),
        "create output directory if it does not exist")
    ("prefix,p",
        po::value<std::string>(&prefix),
        "prefix for output file names")
    ("compress,z",
        po::value<bool>(&opts.compress)->zero_tokens(),
        "compress results")
    ("no-uncompress,Z",
        po::value<bool>(&no_uncompress)->zero_tokens(),
        "do not uncompress or unpack results")
    ("retries,r",
        po::value<size_t>(&retries)->default_value(opts.retries),
        "number of retries")
    ("retry-delay,d",
        po::value<size_t>(&retry_delay)
            ->default_value(opts.retry_delay.count()),
        "delay between retries in seconds")
    ("timeout,t",
        po::value<size_t>(&timeout)->default_value(opts.timeout.count()),
        "connection timeout and upper bound per transfer in seconds "
        "(0 = unlimited)")
    ("no-retry,R",
        po::value<bool>(&no_retry)->zero_tokens(),
        "do not retry failed transfers")
    ("no-follow,L",
        po::value<bool>(&no_follow)->zero_tokens(),
        "do not follow links in downloaded documents")
    ("skip-existing,s",
        po::value<bool>(&opts.skip_existing)->zero_tokens(),
        "keep existing output files")
    ("tmpdir,T",
        po::value<std::string>(&tmpdir),
        "directory for temporary files")
    ("exclude,x",
        po::value<std::vector<std::string>>(&exclude),
        "exclude pattern for directory copies")
    ("private,P",
        po::value<bool>(&opts.private_mode)->zero_tokens(),
        "do not use or store credentials and cookies")
    ("user,u",
        po::value<std::string>(&user),
        "credentials as USER:PASSWORD")
    ("list-drivers",
        "list available drivers and exit")
    ("uri",
        po::value<std::vector<std::string>>(&uris),
        "URIs to fetch")
    ;
  // clang-format on

  tool::add_common_options(opts_desc, logopts);

  po::positional_options_description pos;
  pos.add("uri", -1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(opts_desc)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return kExitInvalidOptions;
  }

  auto constexpr usage = "Usage: urifetch [OPTIONS...] [URI...]\n";

  if (vm.contains("help")) {
    iol.out << tool::tool_header("urifetch") << usage << "\n"
            << opts_desc << "\n";
    return kExitSuccess;
  }

  try {
    stream_logger lgr(iol.term, iol.err, logopts);
    LOG_PROXY(debug_logger_policy, lgr);

    if (vm.contains("output") && vm.contains("output-overwrite")) {
      LOG_ERROR << "--output and --output-overwrite are mutually exclusive";
      return kExitInvalidOptions;
    }

    if (vm.contains("output-overwrite")) {
      if (opts.skip_existing) {
        LOG_ERROR << "--output-overwrite and --skip-existing are mutually "
                     "exclusive";
        return kExitInvalidOptions;
      }
      output_dir = overwrite_dir;
      opts.overwrite = true;
    }

    if (opts.compress && no_uncompress) {
      LOG_WARN << "--no-uncompress has no effect with --compress";
    }

    opts.retries = no_retry ? 0 : retries;
    opts.retry_delay = std::chrono::seconds(retry_delay);
    opts.timeout = std::chrono::seconds(timeout);
    opts.follow_links = !no_follow;
    opts.uncompress = !no_uncompress;
    opts.prefix = prefix;
    opts.exclude = exclude;

    if (!output_dir.empty()) {
      opts.output_dir = output_dir;
    }

    if (!tmpdir.empty()) {
      if (!fs::is_directory(tmpdir)) {
        LOG_ERROR << "temporary directory does not exist: " << tmpdir;
        return kExitInvalidOptions;
      }
      opts.tmpdir = tmpdir;
    }

    std::optional<credential> explicit_cred;

    if (vm.contains("user")) {
      if (user.find(':') == std::string::npos) {
        LOG_ERROR << "--user expects USER:PASSWORD";
        return kExitInvalidOptions;
      }
      explicit_cred = credential::parse(user);
      opts.user = explicit_cred->user;
      opts.password = explicit_cred->password;
    }

    driver_registry registry(lgr);

    if (!drivers_file.empty()) {
      try {
        registry.load_definitions(*iol.file, drivers_file);
      } catch (std::exception const& e) {
        LOG_ERROR << exception_str(e);
        return kExitInvalidOptions;
      }
    }

    if (vm.contains("list-drivers")) {
      list_drivers(registry, iol);
      return kExitSuccess;
    }

    if (!input_file.empty()) {
      if (input_file == "-") {
        read_uri_list(iol.in, uris);
      } else {
        std::error_code ec;
        auto in = iol.file->open_input(input_file, ec);
        if (ec) {
          LOG_ERROR << "cannot open " << input_file << ": " << ec.message();
          return kExitInvalidOptions;
        }
        read_uri_list(in->is(), uris);
      }
    }

    if (uris.empty()) {
      iol.err << usage;
      LOG_ERROR << "no URIs given";
      return kExitInvalidOptions;
    }

    {
      std::error_code ec;

      if (!fs::exists(opts.output_dir, ec)) {
        if (!create_output_dir) {
          LOG_ERROR << "output directory does not exist: "
                    << opts.output_dir.string();
          return kExitOutputDir;
        }

        fs::create_directories(opts.output_dir, ec);

        if (ec) {
          LOG_ERROR << "cannot create output directory "
                    << opts.output_dir.string() << ": " << ec.message();
          return kExitOutputDir;
        }

        LOG_VERBOSE << "created output directory " << opts.output_dir.string();
      } else if (!fs::is_directory(opts.output_dir, ec)) {
        LOG_ERROR << "not a directory: " << opts.output_dir.string();
        return kExitOutputDir;
      }
    }

    auto const config_dir = default_config_dir(*iol.os);

    LOG_DEBUG << "configuration directory: " << config_dir.string();

    credential_store store(lgr, *iol.file, config_dir / kCredentialsFile,
                           !opts.private_mode);
    session_store session(config_dir / kCookieJarFile, opts.private_mode);
    terminal_prompt prompt(iol);
    credential_manager creds(lgr, store,
                             {.explicit_credential = explicit_cred,
                              .private_mode = opts.private_mode,
                              .quiet = opts.quiet},
                             &prompt);

    if (!opts.private_mode) {
      std::error_code ec;
      fs::create_directories(config_dir, ec);
      if (ec) {
        LOG_WARN << "cannot create " << config_dir.string() << ": "
                 << ec.message();
      }
    }

    watchdog wd(lgr);
    transfer_orchestrator orchestrator(lgr, opts, registry, creds, session,
                                       *iol.file, *iol.os, wd, iol.out);

    work_queue queue(std::move(uris));

    auto summary = orchestrator.run(queue);

    return summary.exit_code;
  } catch (std::exception const& e) {
    iol.err << exception_str(e) << "\n";
    return kExitFailure;
  }
}

} // namespace urifetch::tool
