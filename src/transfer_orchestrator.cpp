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

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <system_error>

#include <fmt/format.h>

#include <urifetch/archive_transform.h>
#include <urifetch/credential_store.h>
#include <urifetch/driver_registry.h>
#include <urifetch/error.h>
#include <urifetch/glob_matcher.h>
#include <urifetch/link_follower.h>
#include <urifetch/local_artifact.h>
#include <urifetch/logger.h>
#include <urifetch/os_access.h>
#include <urifetch/run_options.h>
#include <urifetch/transfer_orchestrator.h>
#include <urifetch/uri.h>
#include <urifetch/util.h>
#include <urifetch/watchdog.h>
#include <urifetch/work_queue.h>

namespace urifetch {

namespace fs = std::filesystem;

namespace internal {

namespace {

constexpr std::string_view kCompressedSuffix{".gz"};

enum class uri_state { DONE, SKIPPED, FOLLOWED, GZ_FALLBACK, FAILED };

} // namespace

template <typename LoggerPolicy>
class transfer_orchestrator_ final : public transfer_orchestrator::impl,
                                     private form_submitter {
 public:
  transfer_orchestrator_(logger& lgr, run_options const& opts,
                         driver_registry const& drivers,
                         credential_manager& creds,
                         session_store const& session, file_access const& fa,
                         os_access const& os, watchdog& wd, std::ostream& out)
      : LOG_PROXY_INIT(lgr)
      , opts_{opts}
      , drivers_{drivers}
      , creds_{creds}
      , session_{session}
      , os_{os}
      , wd_{wd}
      , out_{out}
      , call_opts_{std::make_shared<run_options const>(opts)}
      , exclude_{opts.exclude.empty()
                     ? nullptr
                     : std::make_shared<glob_matcher const>(opts.exclude)}
      , follower_{lgr, fa, os, creds, *this}
      , transform_{lgr, fa} {}

  run_summary run(work_queue& queue) override {
    summary_ = run_summary{};

    auto ti = LOG_TIMED_VERBOSE;

    while (!queue.empty()) {
      if (termination_requested()) {
        break;
      }

      auto input = queue.pop_front();
      auto res = process(input, queue);

      if (res.status == kStatusAborted) {
        break;
      }

      if (!res.ok()) {
        if (opts_.abort_on_error) {
          LOG_ERROR << "aborting run after failure of " << input;
          summary_.exit_code = exit_code_for_status(res.status);
          return finish(std::move(ti));
        }
        summary_.exit_code = kExitFailure;
      }
    }

    if (termination_requested()) {
      LOG_ERROR << "run aborted by signal " << termination_signal() << ", "
                << queue.size() << " URI" << (queue.size() == 1 ? "" : "s")
                << " left unprocessed";
      summary_.exit_code = kStatusAborted;
    }

    return finish(std::move(ti));
  }

  transfer_result
  process(std::string const& input, work_queue& queue) override {
    auto [state, res] = process_uri(input, queue);

    switch (state) {
    case uri_state::DONE:
      ++summary_.succeeded;
      break;

    case uri_state::SKIPPED:
      ++summary_.skipped;
      break;

    case uri_state::FOLLOWED:
      ++summary_.followed;
      break;

    case uri_state::GZ_FALLBACK:
      ++summary_.gz_fallbacks;
      break;

    case uri_state::FAILED:
      if (res.status != kStatusAborted) {
        ++summary_.failed;
        LOG_ERROR << input << ": " << status_description(res.status)
                  << (res.message.empty() ? "" : ": ") << res.message
                  << " [" << res.status << "]";
      }
      break;
    }

    return res;
  }

 private:
  template <typename Timed>
  run_summary finish(Timed&& ti) {
    ti << "processed " << summary_.succeeded + summary_.failed << " URIs";

    LOG_VERBOSE << "summary: " << summary_.succeeded << " succeeded, "
                << summary_.failed << " failed, " << summary_.skipped
                << " skipped, " << summary_.followed << " followed, "
                << summary_.gz_fallbacks << " .gz fallbacks";

    return summary_;
  }

  std::pair<uri_state, transfer_result>
  fail(transfer_result res) {
    return {uri_state::FAILED, std::move(res)};
  }

  std::pair<uri_state, transfer_result>
  process_uri(std::string const& input, work_queue& queue) {
    uri u;

    try {
      u = uri::from_input(input, os_.current_path());
    } catch (std::exception const& e) {
      return fail(transfer_result::failure(kStatusFatal, exception_str(e)));
    }

    LOG_DEBUG << "resolving " << u.str();

    driver* drv{nullptr};

    try {
      drv = &drivers_.resolve(u.driver_name());
    } catch (no_driver_error const& e) {
      return fail(transfer_result::failure(kStatusNoDriver, e.what()));
    }

    auto const sink = opts_.output_dir / (opts_.prefix + u.filename());

    try {
      if (!prepare_sink(sink)) {
        LOG_INFO << "keeping existing " << sink.string();
        report(sink);
        return {uri_state::SKIPPED, transfer_result::success()};
      }
    } catch (sink_conflict_error const& e) {
      return fail(transfer_result::failure(kStatusSinkConflict, e.what()));
    }

    std::optional<credential> cred;

    if (!u.host().empty()) {
      try {
        cred = creds_.load_credentials(u.index_key(), false);
      } catch (std::exception const& e) {
        return fail(transfer_result::failure(kStatusFatal, exception_str(e)));
      }
    }

    LOG_INFO << "fetching " << u.str() << " with " << drv->name() << " driver";

    auto res = dispatch(
        u.str(), [drv, u, sink](transfer_context const& ctx) {
          return drv->transfer(u, sink, ctx);
        },
        std::move(cred));

    if (res.not_found() && !u.path().ends_with(kCompressedSuffix)) {
      remove_partial(sink);
      auto alt = u.with_suffix(kCompressedSuffix);
      LOG_INFO << u.str() << " not found, trying " << alt.str();
      queue.push_front(alt.str());
      return {uri_state::GZ_FALLBACK, transfer_result::success()};
    }

    if (!res.ok()) {
      remove_partial(sink);
      return fail(std::move(res));
    }

    local_artifact artifact(sink);

    LOG_INFO << "fetched " << u.str() << " to " << sink.string() << " ("
             << artifact_kind_name(artifact.kind()) << ", "
             << size_with_unit(artifact.size()) << ")";

    if (opts_.follow_links) {
      link_follow_outcome lfo;

      try {
        lfo = follower_.follow(u, artifact);
      } catch (std::exception const& e) {
        return fail(transfer_result::failure(kStatusFatal, exception_str(e)));
      }

      switch (lfo.act) {
      case link_follow_outcome::action::KEEP:
        break;

      case link_follow_outcome::action::FOLLOW:
        queue.push_front(std::span<std::string const>(lfo.discovered));
        return {uri_state::FOLLOWED, transfer_result::success()};

      case link_follow_outcome::action::REQUEUE:
        if (termination_requested()) {
          return fail(transfer_result::failure(kStatusAborted));
        }
        queue.push_front(input);
        return {uri_state::FOLLOWED, transfer_result::success()};

      case link_follow_outcome::action::FAILED:
        remove_partial(sink);
        return fail(std::move(lfo.result));
      }
    }

    try {
      archive_action action{archive_action::NONE};

      if (opts_.compress) {
        action = transform_.compress(artifact);
      } else if (opts_.uncompress) {
        action = transform_.uncompress(artifact, opts_.output_dir);
      }

      if (action != archive_action::NONE) {
        LOG_INFO << archive_action_name(action) << ": "
                 << artifact.path().string();
      }
    } catch (std::exception const& e) {
      return fail(
          transfer_result::failure(kStatusArchiveFailure, exception_str(e)));
    }

    report(artifact.path());

    return {uri_state::DONE, transfer_result::success()};
  }

  // Runs a driver call under the watchdog. An abandoned call can outlive
  // this object, so the call owns everything it reads except `os_`.
  transfer_result
  dispatch(std::string const& what,
           std::function<transfer_result(transfer_context const&)> call,
           std::optional<credential> cred) {
    try {
      return wd_.supervise(
          opts_.timeout,
          [call = std::move(call), cred = std::move(cred), &os = os_,
           opts = call_opts_, exclude = exclude_,
           jar = session_.cookie_jar()](job_control& jobs) {
            transfer_context ctx{*opts, jobs, os, jar, cred, exclude.get()};
            return call(ctx);
          });
    } catch (std::exception const& e) {
      LOG_ERROR << what << ": driver call failed: " << exception_str(e);
      return transfer_result::failure(kStatusFatal, exception_str(e));
    }
  }

  transfer_result submit(uri const& endpoint, form_fields const& fields,
                         fs::path const& dest, credential const& cred) override {
    driver* drv{nullptr};

    try {
      drv = &drivers_.resolve(endpoint.driver_name());
    } catch (no_driver_error const& e) {
      return transfer_result::failure(kStatusNoDriver, e.what());
    }

    LOG_VERBOSE << "submitting login form to " << endpoint.str();

    return dispatch(
        endpoint.str(),
        [drv, endpoint, fields, dest](transfer_context const& ctx) {
          return drv->submit_form(endpoint, fields, dest, ctx);
        },
        cred);
  }

  // Returns false if an existing sink is to be kept as the result.
  bool prepare_sink(fs::path const& sink) {
    local_artifact existing(sink);

    if (!existing.exists()) {
      return true;
    }

    if (opts_.skip_existing) {
      return false;
    }

    if (!opts_.overwrite) {
      URIFETCH_THROW(sink_conflict_error,
                     fmt::format("{} already exists", sink.string()));
    }

    LOG_VERBOSE << "removing existing " << sink.string();

    try {
      existing.remove();
    } catch (std::exception const& e) {
      URIFETCH_THROW(sink_conflict_error, exception_str(e));
    }

    return true;
  }

  void remove_partial(fs::path const& sink) {
    std::error_code ec;

    if (fs::exists(fs::symlink_status(sink, ec))) {
      LOG_DEBUG << "removing partial " << sink.string();
      fs::remove_all(sink, ec);
      if (ec) {
        LOG_WARN << "cannot remove " << sink.string() << ": " << ec.message();
      }
    }
  }

  void report(fs::path const& path) {
    summary_.reported.push_back(path);
    if (!opts_.quiet) {
      out_ << path.string() << '\n';
      out_.flush();
    }
  }

  LOG_PROXY_DECL(LoggerPolicy);
  run_options const& opts_;
  driver_registry const& drivers_;
  credential_manager& creds_;
  session_store const& session_;
  os_access const& os_;
  watchdog& wd_;
  std::ostream& out_;
  std::shared_ptr<run_options const> const call_opts_;
  std::shared_ptr<glob_matcher const> const exclude_;
  link_follower follower_;
  archive_transform transform_;
  run_summary summary_;
};

} // namespace internal

transfer_orchestrator::transfer_orchestrator(
    logger& lgr, run_options const& opts, driver_registry const& drivers,
    credential_manager& creds, session_store const& session,
    file_access const& fa, os_access const& os, watchdog& wd, std::ostream& out)
    : impl_{make_unique_logging_object<impl, internal::transfer_orchestrator_,
                                       logger_policies>(
          lgr, opts, drivers, creds, session, fa, os, wd, out)} {}

} // namespace urifetch
