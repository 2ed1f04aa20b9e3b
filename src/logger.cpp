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

#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <iterator>

#include <folly/Conv.h>
#include <folly/small_vector.h>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <urifetch/error.h>
#include <urifetch/logger.h>
#include <urifetch/string.h>
#include <urifetch/terminal_ansi.h>
#include <urifetch/util.h>

namespace urifetch {

namespace {

struct level_info {
  std::string_view name;
  char abbrev;
};

constexpr std::array<level_info, 6> level_table{{
    {"error", 'E'},
    {"warn", 'W'},
    {"info", 'I'},
    {"verbose", 'V'},
    {"debug", 'D'},
    {"trace", 'T'},
}};

level_info const& info_for(logger::level_type level) {
  if (level >= level_table.size()) {
    URIFETCH_THROW(runtime_error, fmt::format("invalid logger level: {}",
                                              static_cast<int>(level)));
  }
  return level_table[level];
}

} // namespace

char logger::level_char(level_type level) { return info_for(level).abbrev; }

std::string_view logger::level_name(level_type level) {
  return info_for(level).name;
}

logger::level_type logger::parse_level(std::string_view level) {
  auto it = std::ranges::find(level_table, level, &level_info::name);
  if (it == level_table.end()) {
    URIFETCH_THROW(runtime_error,
                   fmt::format("invalid logger level: {}", level));
  }
  return static_cast<level_type>(std::distance(level_table.begin(), it));
}

std::string logger::all_level_names() {
  std::string result;
  for (auto const& li : level_table) {
    if (!result.empty()) {
      result += ", ";
    }
    result += li.name;
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval) {
  return os << logger::level_name(optval);
}

std::istream& operator>>(std::istream& is, logger::level_type& optval) {
  std::string s;
  is >> s;
  optval = logger::parse_level(s);
  return is;
}

null_logger::null_logger() { set_policy<prod_logger_policy>(); }

stream_logger::stream_logger(logger_options const& options)
    : stream_logger(std::cerr, options) {}

stream_logger::stream_logger(std::ostream& os, logger_options const& options)
    : stream_logger(std::make_shared<terminal_ansi>(), os, options) {}

stream_logger::stream_logger(std::shared_ptr<terminal const> term,
                             std::ostream& os, logger_options const& options)
    : os_(os)
    , threshold_(options.threshold)
    , color_(term->is_tty(os) && term->is_fancy())
    , with_context_(options.with_context.value_or(options.threshold >=
                                                  logger::VERBOSE))
    , term_{std::move(term)} {
  if (threshold_ >= logger::DEBUG) {
    set_policy<debug_logger_policy>();
  } else {
    set_policy<prod_logger_policy>();
  }
}

logger::level_type stream_logger::threshold() const { return threshold_; }

std::string_view stream_logger::level_color(level_type level) const {
  switch (level) {
  case ERROR:
    return term_->color(termcolor::RED, termstyle::BOLD);
  case WARN:
    return term_->color(termcolor::YELLOW, termstyle::BOLD);
  case VERBOSE:
    return term_->color(termcolor::CYAN, termstyle::DIM);
  case DEBUG:
    return term_->color(termcolor::YELLOW, termstyle::DIM);
  case TRACE:
    return term_->color(termcolor::GRAY);
  case INFO:
    break;
  }
  return {};
}

void stream_logger::write(level_type level, std::string_view output,
                          source_location loc) {
  if (level > threshold_) {
    return;
  }

  std::string_view prefix;
  std::string_view suffix;

  if (color_) {
    prefix = level_color(level);
    if (!prefix.empty()) {
      suffix = term_->color(termcolor::NORMAL);
    }
  }

  auto stamp = fmt::format("{} {} ", logger::level_char(level),
                           get_current_time_string());
  std::string context;
  size_t context_len = 0;

  if (with_context_) {
    context = get_logger_context(loc);
    context_len = context.size();
    if (color_) {
      context = folly::to<std::string>(
          suffix, term_->color(termcolor::MAGENTA, termstyle::DIM), context,
          term_->color(termcolor::NORMAL), prefix);
    }
  }

  std::string text;
  text.reserve(output.size());
  std::ranges::copy_if(output, std::back_inserter(text),
                       [](char c) { return c != '\r'; });

  folly::small_vector<std::string_view, 4> lines;
  split_to(text, '\n', lines);

  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  if (lines.empty()) {
    lines.push_back("<<< no log message >>>");
  }

  std::string const blank(stamp.size() + context_len, ' ');
  std::ostringstream oss;

  for (size_t i = 0; i < lines.size(); ++i) {
    oss << prefix;
    if (i == 0) {
      oss << stamp << context;
    } else {
      oss << blank;
    }
    oss << lines[i] << suffix << '\n';
  }

  std::lock_guard lock(mx_);
  if (&os_ == &std::cerr) {
    fmt::print(stderr, "{}", oss.str());
  } else {
    os_ << oss.str();
  }
}

class timed_level_log_entry::state {
 public:
  state(logger& lgr, logger::level_type level, source_location loc)
      : lgr_{lgr}
      , level_{level}
      , start_time_{std::chrono::steady_clock::now()}
      , loc_{loc} {}

  void log(std::ostringstream& oss) const {
    std::chrono::duration<double> sec =
        std::chrono::steady_clock::now() - start_time_;
    oss << " [" << time_with_unit(sec.count()) << "]";
    lgr_.write(level_, oss.str(), loc_);
  }

 private:
  logger& lgr_;
  logger::level_type const level_;
  std::chrono::steady_clock::time_point const start_time_;
  source_location const loc_;
};

timed_level_log_entry::timed_level_log_entry(logger& lgr,
                                             logger::level_type level,
                                             source_location loc) {
  if (level <= lgr.threshold()) {
    state_ = std::make_unique<state>(lgr, level, loc);
  }
}

timed_level_log_entry::~timed_level_log_entry() {
  if (state_ && output_) {
    state_->log(oss_);
  }
}

namespace detail {

void throw_unknown_logger_policy(std::string_view name) {
  URIFETCH_THROW(runtime_error,
                 fmt::format("no such logger policy: {}", name));
}

} // namespace detail

std::string get_logger_context(source_location loc) {
  return fmt::format("[{0}:{1}] ", basename(loc.file_name()), loc.line());
}

std::string get_current_time_string() {
  using namespace std::chrono;
  auto const now = floor<microseconds>(system_clock::now());
  auto const local = safe_localtime(system_clock::to_time_t(now));
  return fmt::format("{:%H:%M}:{:%S}", local, now);
}

} // namespace urifetch
