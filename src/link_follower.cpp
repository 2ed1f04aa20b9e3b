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
#include <cctype>
#include <iterator>
#include <regex>
#include <unordered_set>

#include <fmt/format.h>

#include <urifetch/conv.h>
#include <urifetch/credential_store.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/link_follower.h>
#include <urifetch/local_artifact.h>
#include <urifetch/logger.h>
#include <urifetch/os_access.h>
#include <urifetch/string.h>
#include <urifetch/uri.h>
#include <urifetch/util.h>

namespace urifetch {

namespace {

constexpr std::array<std::string_view, 7> kHypertextSuffixes{
    ".html", ".htm", ".php", ".jsp", ".asp", ".aspx", ".cgi"};

constexpr std::array<std::string_view, 4> kLoginActionKeywords{
    "login", "authorize", "signin", "/idp/"};

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

constexpr std::string_view kTagNameChars{
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_:"};

constexpr auto kRegexFlags =
    std::regex_constants::ECMAScript | std::regex_constants::icase;

std::string_view skip_leading_space(std::string_view content) {
  if (content.starts_with(kUtf8Bom)) {
    content.remove_prefix(kUtf8Bom.size());
  }
  return trim(content);
}

std::string decode_entities(std::string_view str) {
  static constexpr std::array<std::pair<std::string_view, char>, 5> entities{{
      {"&amp;", '&'},
      {"&quot;", '"'},
      {"&apos;", '\''},
      {"&lt;", '<'},
      {"&gt;", '>'},
  }};

  std::string rv;
  rv.reserve(str.size());

  while (!str.empty()) {
    bool matched = false;

    if (str.front() == '&') {
      for (auto const& [name, c] : entities) {
        if (str.starts_with(name)) {
          rv += c;
          str.remove_prefix(name.size());
          matched = true;
          break;
        }
      }
    }

    if (!matched) {
      rv += str.front();
      str.remove_prefix(1);
    }
  }

  return rv;
}

std::optional<std::string> attribute(std::string_view tag,
                                     std::string_view name) {
  std::regex re(
      fmt::format(
          R"re((?:^|[\s<])({})\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+)))re",
          name),
      kRegexFlags);
  std::match_results<std::string_view::const_iterator> m;

  if (std::regex_search(tag.begin(), tag.end(), m, re)) {
    for (size_t i = 2; i <= 4; ++i) {
      if (m[i].matched) {
        return decode_entities(std::string_view(&*m[i].first, m[i].length()));
      }
    }
    return std::string{};
  }

  return std::nullopt;
}

size_t ifind(std::string_view str, std::string_view what, size_t pos = 0) {
  if (pos > str.size()) {
    return std::string_view::npos;
  }

  auto hay = str.substr(pos);
  auto found = std::ranges::search(hay, what, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });

  return found.empty() && !what.empty()
             ? std::string_view::npos
             : pos + std::distance(hay.begin(), found.begin());
}

// All opening tags `<tag ...>` in document order, any tag if `tag` is empty.
std::vector<std::string_view> find_tags(std::string_view content,
                                        std::string_view tag) {
  std::vector<std::string_view> tags;
  size_t pos = 0;

  while ((pos = content.find('<', pos)) != std::string_view::npos) {
    auto rest = content.substr(pos + 1);

    if (rest.empty() || !std::isalpha(static_cast<unsigned char>(rest[0]))) {
      ++pos;
      continue;
    }

    auto end = content.find('>', pos);

    if (end == std::string_view::npos) {
      break;
    }

    auto name = rest.substr(0, rest.find_first_not_of(kTagNameChars));

    if (tag.empty() || iequals(name, tag)) {
      tags.push_back(content.substr(pos, end - pos + 1));
      pos = end + 1;
    } else {
      ++pos;
    }
  }

  return tags;
}

bool is_indirection_line(std::string_view line) {
  return uri::looks_like_uri(line) &&
         line.find_first_of(" \t<>\"") == std::string_view::npos;
}

std::string_view root_element(std::string_view doc) {
  while (!doc.empty()) {
    auto lt = doc.find('<');

    if (lt == std::string_view::npos || lt + 1 >= doc.size()) {
      break;
    }

    doc.remove_prefix(lt + 1);

    if (doc.starts_with("?")) {
      doc.remove_prefix(std::min(doc.size(), doc.find("?>")));
      continue;
    }

    if (doc.starts_with("!--")) {
      doc.remove_prefix(std::min(doc.size(), doc.find("-->")));
      continue;
    }

    if (doc.starts_with("!")) {
      continue;
    }

    auto end = doc.find_first_of(" \t\r\n/>");
    auto name = doc.substr(0, end);

    if (auto colon = name.find(':'); colon != std::string_view::npos) {
      name.remove_prefix(colon + 1);
    }

    return name;
  }

  return {};
}

bool has_hypertext_suffix(std::string_view filename) {
  auto lower = to_lower(filename);
  return std::ranges::any_of(kHypertextSuffixes, [&](std::string_view sfx) {
    return std::string_view(lower).ends_with(sfx);
  });
}

bool looks_like_hypertext(std::string_view doc, std::string_view filename) {
  return starts_with_icase(doc, "<!doctype html") ||
         starts_with_icase(doc, "<html") || has_hypertext_suffix(filename);
}

bool is_ignored_reference(std::string_view ref) {
  return ref.empty() || ref.starts_with('#') || ref.starts_with('?') ||
         starts_with_icase(ref, "mailto:") ||
         starts_with_icase(ref, "javascript:") || ref == ".." ||
         ref.starts_with("../");
}

bool is_parent_of(uri const& target, uri const& base) {
  if (target.scheme() != base.scheme() ||
      target.authority() != base.authority()) {
    return false;
  }

  auto const& base_path = base.path();
  auto dir = std::string_view(base_path).substr(0, base_path.rfind('/') + 1);
  auto const& tp = target.path();

  return tp.size() < dir.size() && tp.ends_with('/') && dir.starts_with(tp);
}

} // namespace

std::string_view content_class_name(content_class cc) {
  switch (cc) {
  case content_class::NONE:
    return "none";
  case content_class::INDIRECTION_LIST:
    return "indirection list";
  case content_class::RESOURCE_LISTING:
    return "resource listing";
  case content_class::HYPERTEXT:
    return "hypertext";
  case content_class::LOGIN_PAGE:
    return "login page";
  }
  return "unknown";
}

namespace detail {

std::vector<std::string> indirection_list(std::string_view content) {
  std::vector<std::string> rv;

  for (auto line : split_to<std::vector<std::string_view>>(content, '\n')) {
    line = trim(line);
    if (!line.empty() && !line.starts_with('#')) {
      rv.emplace_back(line);
    }
  }

  return rv;
}

std::vector<std::string>
attribute_values(std::string_view content, std::string_view tag,
                 std::string_view attr) {
  std::vector<std::string> rv;

  for (auto t : find_tags(content, tag)) {
    if (auto value = attribute(t, attr)) {
      rv.push_back(std::move(*value));
    }
  }

  return rv;
}

std::optional<meta_refresh> find_meta_refresh(std::string_view content) {
  for (auto tag : find_tags(content, "meta")) {
    auto equiv = attribute(tag, "http-equiv");

    if (!equiv || !iequals(trim(*equiv), "refresh")) {
      continue;
    }

    auto value = attribute(tag, "content").value_or(std::string{});
    std::string_view refresh_value{value};
    meta_refresh rv;

    auto semi = refresh_value.find_first_of(";,");
    auto delay = trim(refresh_value.substr(0, semi));

    if (auto secs = try_to<int>(std::string(delay)); secs && *secs > 0) {
      rv.delay = std::chrono::seconds(*secs);
    }

    if (semi != std::string_view::npos) {
      auto target = trim(refresh_value.substr(semi + 1));

      if (starts_with_icase(target, "url")) {
        auto rest = trim(target.substr(3));
        if (rest.starts_with('=')) {
          target = trim(rest.substr(1));
        }
      }

      if (target.size() >= 2 && (target.front() == '\'' || target.front() == '"') &&
          target.back() == target.front()) {
        target = target.substr(1, target.size() - 2);
      }

      rv.target = std::string(target);
    }

    return rv;
  }

  return std::nullopt;
}

std::optional<login_form> find_login_form(std::string_view content) {
  for (auto open : find_tags(content, "form")) {
    auto body_pos = static_cast<size_t>(open.data() - content.data()) +
                    open.size();
    auto close = ifind(content, "</form", body_pos);

    if (close == std::string_view::npos) {
      break;
    }

    auto body = content.substr(body_pos, close - body_pos);
    auto action = attribute(open, "action");

    if (!action) {
      continue;
    }

    auto lower_action = to_lower(*action);

    if (std::ranges::none_of(kLoginActionKeywords, [&](std::string_view kw) {
          return lower_action.find(kw) != std::string::npos;
        })) {
      continue;
    }

    login_form form;
    bool have_password = false;
    bool have_user = false;

    form.action = *action;

    for (auto input : find_tags(body, "input")) {
      auto type = to_lower(attribute(input, "type").value_or("text"));
      auto name = attribute(input, "name");

      if (type == "password") {
        have_password = true;
        if (name && !name->empty()) {
          form.password_field = *name;
        }
      } else if (type == "hidden") {
        if (name && !name->empty()) {
          form.hidden.emplace_back(*name,
                                   attribute(input, "value").value_or(""));
        }
      } else if (!have_user && (type == "text" || type == "email")) {
        if (name && !name->empty()) {
          form.user_field = *name;
          have_user = true;
        }
      }
    }

    if (have_password) {
      return form;
    }
  }

  return std::nullopt;
}

content_class classify_content(std::string_view content,
                               std::string_view filename) {
  auto doc = skip_leading_space(content);

  if (doc.empty()) {
    return content_class::NONE;
  }

  auto first_line = trim(doc.substr(0, doc.find('\n')));

  if (is_indirection_line(first_line)) {
    return content_class::INDIRECTION_LIST;
  }

  if (doc.starts_with("<?xml")) {
    auto root = root_element(doc);
    if (root == "feed" || root == "metalink") {
      return content_class::RESOURCE_LISTING;
    }
  }

  if (looks_like_hypertext(doc, filename)) {
    if (!find_meta_refresh(doc) && find_login_form(doc)) {
      return content_class::LOGIN_PAGE;
    }
    return content_class::HYPERTEXT;
  }

  if (find_login_form(content)) {
    return content_class::LOGIN_PAGE;
  }

  return content_class::NONE;
}

std::vector<std::string>
resolve_references(uri const& base, std::vector<std::string> const& refs) {
  std::vector<std::string> rv;
  std::unordered_set<std::string> seen;

  for (auto const& ref : refs) {
    auto r = trim(ref);

    if (is_ignored_reference(r)) {
      continue;
    }

    uri target;

    try {
      target = base.resolve(r);
    } catch (runtime_error const&) {
      continue;
    }

    if (target == base || is_parent_of(target, base)) {
      continue;
    }

    auto key = target.trailing_segment();

    if (key.empty()) {
      key = target.path();
    }

    if (seen.insert(key).second) {
      rv.push_back(target.str());
    }
  }

  return rv;
}

} // namespace detail

namespace internal {

template <typename LoggerPolicy>
class link_follower_ final : public link_follower::impl {
 public:
  link_follower_(logger& lgr, file_access const& fa, os_access const& os,
                 credential_manager& creds, form_submitter& forms)
      : LOG_PROXY_INIT(lgr)
      , fa_{fa}
      , os_{os}
      , creds_{creds}
      , forms_{forms} {}

  link_follow_outcome
  follow(uri const& current, local_artifact& artifact) override {
    link_follow_outcome rv;

    if (!artifact.is_regular() || artifact.size() >= kLinkFollowMaxSize) {
      LOG_TRACE << "not inspecting " << artifact.path().string() << " ("
                << artifact_kind_name(artifact.kind()) << ", "
                << size_with_unit(artifact.size()) << ")";
      return rv;
    }

    auto content = fa_.read_file(artifact.path());
    auto filename = artifact.path().filename().string();

    rv.kind = detail::classify_content(content, filename);

    LOG_DEBUG << artifact.path().string() << " classified as "
              << content_class_name(rv.kind);

    switch (rv.kind) {
    case content_class::NONE:
      break;

    case content_class::INDIRECTION_LIST:
      rv.discovered = detail::indirection_list(content);
      break;

    case content_class::RESOURCE_LISTING:
      rv.discovered = detail::resolve_references(
          current, detail::attribute_values(content, "", "href"));
      break;

    case content_class::HYPERTEXT:
      if (auto refresh = detail::find_meta_refresh(content)) {
        return follow_refresh(current, artifact, *refresh);
      }
      rv.discovered = detail::resolve_references(
          current, detail::attribute_values(content, "a", "href"));
      break;

    case content_class::LOGIN_PAGE:
      return login(current, artifact, content);
    }

    if (!rv.discovered.empty()) {
      LOG_INFO << "following " << rv.discovered.size() << " link"
               << (rv.discovered.size() == 1 ? "" : "s") << " from "
               << content_class_name(rv.kind) << " " << current.str();
      for (auto const& d : rv.discovered) {
        LOG_VERBOSE << "  " << d;
      }
      artifact.remove();
      rv.act = link_follow_outcome::action::FOLLOW;
    }

    return rv;
  }

 private:
  link_follow_outcome
  follow_refresh(uri const& current, local_artifact& artifact,
                 detail::meta_refresh const& refresh) {
    link_follow_outcome rv;
    rv.kind = content_class::HYPERTEXT;

    std::optional<uri> target;

    if (!refresh.target.empty()) {
      try {
        target = current.resolve(refresh.target);
      } catch (runtime_error const& e) {
        LOG_WARN << "ignoring invalid refresh target in " << current.str()
                 << ": " << exception_str(e);
        return rv;
      }
    }

    artifact.remove();

    if (!target || *target == current) {
      LOG_INFO << current.str() << " not ready, polling again in "
               << time_with_unit(refresh.delay);
      os_.sleep_for(refresh.delay);
      rv.act = link_follow_outcome::action::REQUEUE;
    } else {
      LOG_INFO << "refresh redirects " << current.str() << " to "
               << target->str();
      rv.discovered.push_back(target->str());
      rv.act = link_follow_outcome::action::FOLLOW;
    }

    return rv;
  }

  link_follow_outcome login(uri const& current, local_artifact& artifact,
                            std::string_view content) {
    link_follow_outcome rv;
    rv.kind = content_class::LOGIN_PAGE;

    auto fail = [&](std::string const& why) {
      LOG_ERROR << "authentication failed for " << current.str() << ": "
                << why;
      rv.act = link_follow_outcome::action::FAILED;
      rv.result = transfer_result::failure(
          kStatusFatal, fmt::format("authentication failed: {}", why));
      return rv;
    };

    auto form = detail::find_login_form(content);

    if (!form) {
      return fail("no login form found");
    }

    uri endpoint;

    try {
      endpoint = current.resolve(form->action);
    } catch (runtime_error const& e) {
      return fail(exception_str(e));
    }

    LOG_INFO << current.str() << " requires a login at "
             << endpoint.index_key();

    auto cred = creds_.load_credentials(endpoint.index_key(), true);

    if (!cred) {
      return fail(
          fmt::format("no credentials available for {}", endpoint.index_key()));
    }

    auto fields = form->hidden;
    fields.emplace_back(form->user_field, cred->user);
    fields.emplace_back(form->password_field, cred->password);

    auto res = forms_.submit(endpoint, fields, artifact.path(), *cred);

    artifact.refresh();

    if (!res.ok()) {
      return fail(res.message.empty()
                      ? fmt::format("login request failed with status {}",
                                    res.status)
                      : res.message);
    }

    if (!artifact.is_regular()) {
      return fail("login request did not produce a response");
    }

    if (artifact.size() <= kLinkFollowMaxSize) {
      if (detail::find_login_form(fa_.read_file(artifact.path()))) {
        return fail("still redirected to the login page");
      }
      return fail(fmt::format("response too small ({})",
                              size_with_unit(artifact.size())));
    }

    LOG_INFO << "login for " << endpoint.index_key() << " succeeded";

    return rv;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  file_access const& fa_;
  os_access const& os_;
  credential_manager& creds_;
  form_submitter& forms_;
};

} // namespace internal

link_follower::link_follower(logger& lgr, file_access const& fa,
                             os_access const& os, credential_manager& creds,
                             form_submitter& forms)
    : impl_{make_unique_logging_object<impl, internal::link_follower_,
                                       logger_policies>(lgr, fa, os, creds,
                                                        forms)} {}

} // namespace urifetch
