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

#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <urifetch/source_location.h>

namespace urifetch {

class terminal;

class logger {
 public:
  enum level_type : unsigned { ERROR, WARN, INFO, VERBOSE, DEBUG, TRACE };

  static char level_char(level_type level);

  virtual ~logger() = default;

  virtual void
  write(level_type level, std::string_view output, source_location loc) = 0;
  virtual level_type threshold() const = 0;

  std::string_view policy_name() const { return policy_name_; }

  static level_type parse_level(std::string_view level);
  static std::string_view level_name(level_type level);

  static std::string all_level_names();

 protected:
  template <class Policy>
  void set_policy() {
    policy_name_ = Policy::name();
  }

 private:
  std::string_view policy_name_;
};

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval);
std::istream& operator>>(std::istream& is, logger::level_type& optval);

struct logger_options {
  logger::level_type threshold{logger::WARN};
  std::optional<bool> with_context{};
};

// Writes to the error stream of the tool. Driver output relayed through
// the logger may contain carriage returns from progress meters, these are
// dropped and multi-line messages are continued with a blank prefix.
class stream_logger : public logger {
 public:
  explicit stream_logger(logger_options const& options = {});
  explicit stream_logger(std::ostream& os, logger_options const& options = {});
  stream_logger(std::shared_ptr<terminal const> term, std::ostream& os,
                logger_options const& options = {});

  void write(level_type level, std::string_view output,
             source_location loc) override;
  level_type threshold() const override;

 private:
  std::string_view level_color(level_type level) const;

  std::ostream& os_;
  std::mutex mutable mx_;
  level_type const threshold_;
  bool const color_;
  bool const with_context_;
  std::shared_ptr<terminal const> term_;
};

class null_logger : public logger {
 public:
  null_logger();

  void write(level_type, std::string_view, source_location) override {}
  level_type threshold() const override { return ERROR; }
};

class level_log_entry {
 public:
  level_log_entry(logger& lgr, logger::level_type level, source_location loc)
      : lgr_(lgr)
      , level_(level)
      , loc_(loc) {}

  level_log_entry(level_log_entry const&) = delete;

  ~level_log_entry() { lgr_.write(level_, oss_.str(), loc_); }

  template <typename T>
  level_log_entry& operator<<(T const& val) {
    oss_ << val;
    return *this;
  }

 private:
  logger& lgr_;
  std::ostringstream oss_;
  logger::level_type const level_;
  source_location const loc_;
};

// Appends the elapsed time since construction, e.g. "fetched x [1.2s]".
class timed_level_log_entry {
 public:
  timed_level_log_entry(logger& lgr, logger::level_type level,
                        source_location loc);
  timed_level_log_entry(timed_level_log_entry const&) = delete;
  ~timed_level_log_entry();

  template <typename T>
  timed_level_log_entry& operator<<(T const& val) {
    if (state_) {
      output_ = true;
      oss_ << val;
    }
    return *this;
  }

 private:
  class state;

  std::ostringstream oss_;
  bool output_{false};
  std::unique_ptr<state const> state_;
};

class no_log_entry {
 public:
  no_log_entry(logger&, logger::level_type, source_location) {}

  template <typename T>
  no_log_entry& operator<<(T const&) {
    return *this;
  }
};

template <logger::level_type MaxLevel>
class max_level_policy {
 public:
  template <logger::level_type Level>
  using entry_type =
      std::conditional_t<Level <= MaxLevel, level_log_entry, no_log_entry>;

  template <logger::level_type Level>
  using timed_entry_type =
      std::conditional_t<Level <= MaxLevel, timed_level_log_entry,
                         no_log_entry>;

  static constexpr bool is_enabled_for(logger::level_type level) {
    return level <= MaxLevel;
  }
};

class prod_logger_policy : public max_level_policy<logger::VERBOSE> {
 public:
  static std::string_view name() { return "prod"; }
};

class debug_logger_policy : public max_level_policy<logger::TRACE> {
 public:
  static std::string_view name() { return "debug"; }
};

using logger_policies = std::tuple<debug_logger_policy, prod_logger_policy>;

template <typename LogPolicy>
class log_proxy {
 public:
  log_proxy(logger& lgr)
      : lgr_(lgr)
      , threshold_(lgr.threshold()) {}

  static constexpr bool policy_is_enabled_for(logger::level_type level) {
    return LogPolicy::is_enabled_for(level);
  }

  bool logger_is_enabled_for(logger::level_type level) const {
    return level <= threshold_;
  }

  template <logger::level_type Level>
  auto entry(source_location loc) const {
    return typename LogPolicy::template entry_type<Level>(lgr_, Level, loc);
  }

  template <logger::level_type Level>
  auto timed_entry(source_location loc) const {
    return typename LogPolicy::template timed_entry_type<Level>(lgr_, Level,
                                                                loc);
  }

  logger& get_logger() const { return lgr_; }

 private:
  logger& lgr_;
  logger::level_type threshold_;
};

#define LOG_DETAIL_LEVEL(level)                                                \
  if constexpr (std::decay_t<decltype(log_)>::policy_is_enabled_for(           \
                    ::urifetch::logger::level))                                \
    if (log_.logger_is_enabled_for(::urifetch::logger::level))                 \
  log_.template entry<::urifetch::logger::level>(                              \
      URIFETCH_CURRENT_SOURCE_LOCATION)

#define LOG_PROXY(policy, lgr) ::urifetch::log_proxy<policy> log_(lgr)
#define LOG_PROXY_DECL(policy) ::urifetch::log_proxy<policy> log_
#define LOG_PROXY_INIT(lgr) log_(lgr)
#define LOG_GET_LOGGER log_.get_logger()
#define LOG_ERROR LOG_DETAIL_LEVEL(ERROR)
#define LOG_WARN LOG_DETAIL_LEVEL(WARN)
#define LOG_INFO LOG_DETAIL_LEVEL(INFO)
#define LOG_VERBOSE LOG_DETAIL_LEVEL(VERBOSE)
#define LOG_DEBUG LOG_DETAIL_LEVEL(DEBUG)
#define LOG_TRACE LOG_DETAIL_LEVEL(TRACE)
#define LOG_TIMED_VERBOSE                                                      \
  log_.template timed_entry<::urifetch::logger::VERBOSE>(                      \
      URIFETCH_CURRENT_SOURCE_LOCATION)

namespace detail {

[[noreturn]] void throw_unknown_logger_policy(std::string_view name);

template <class U, class Base, class... Args>
void emplace_logging_object(std::unique_ptr<Base>& p, Args&&... args) {
  p = std::make_unique<U>(std::forward<Args>(args)...);
}

template <class U, class Base, class... Args>
void emplace_logging_object(std::shared_ptr<Base>& p, Args&&... args) {
  p = std::make_shared<U>(std::forward<Args>(args)...);
}

template <class Ptr, template <class> class T, class PolicyList>
struct logging_object_factory;

// Instantiates T once per policy and picks the one the logger was
// configured with at run time.
template <class Ptr, template <class> class T, class... Policies>
struct logging_object_factory<Ptr, T, std::tuple<Policies...>> {
  template <class... Args>
  static Ptr create(logger& lgr, Args&&... args) {
    Ptr obj;
    bool const found =
        ((lgr.policy_name() == Policies::name() &&
          (emplace_logging_object<T<Policies>>(obj, lgr,
                                               std::forward<Args>(args)...),
           true)) ||
         ...);
    if (!found) {
      throw_unknown_logger_policy(lgr.policy_name());
    }
    return obj;
  }
};

} // namespace detail

template <class Base, template <class> class T, class LoggerPolicyList,
          class... Args>
std::unique_ptr<Base> make_unique_logging_object(logger& lgr, Args&&... args) {
  return detail::logging_object_factory<std::unique_ptr<Base>, T,
                                        LoggerPolicyList>::
      create(lgr, std::forward<Args>(args)...);
}

template <class Base, template <class> class T, class LoggerPolicyList,
          class... Args>
std::shared_ptr<Base> make_shared_logging_object(logger& lgr, Args&&... args) {
  return detail::logging_object_factory<std::shared_ptr<Base>, T,
                                        LoggerPolicyList>::
      create(lgr, std::forward<Args>(args)...);
}

std::string get_logger_context(source_location loc);
std::string get_current_time_string();

} // namespace urifetch
