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

#include <chrono>
#include <filesystem>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <urifetch/credential_store.h>
#include <urifetch/file_access.h>
#include <urifetch/file_access_generic.h>
#include <urifetch/link_follower.h>
#include <urifetch/local_artifact.h>
#include <urifetch/uri.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace urifetch;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::Property;
using ::testing::Return;

namespace fs = std::filesystem;
using action = link_follow_outcome::action;

namespace {

class form_submitter_mock : public form_submitter {
 public:
  MOCK_METHOD(transfer_result, submit,
              (uri const& endpoint, form_fields const& fields,
               fs::path const& dest, credential const& cred),
              (override));
};

constexpr std::string_view kLoginPage{
    R"(<html><body>
<form method="post" action="/idp/profile/SAML2/Login">
  <input type="hidden" name="csrf_token" value="a&amp;b">
  <input type="text" name="j_username">
  <input type="password" name="j_password">
  <input type="submit" value="Login">
</form>
</body></html>
)"};

class link_follower_test : public ::testing::Test {
 protected:
  link_follower_test()
      : store{lgr, *fa, "unused", false} {}

  link_follower make_follower(credential_options const& opts) {
    creds = std::make_unique<credential_manager>(lgr, store, opts);
    return link_follower(lgr, *fa, *os, *creds, forms);
  }

  link_follower make_follower() {
    return make_follower({.explicit_credential = credential{"alice", "pw"}});
  }

  local_artifact put(std::string_view name, std::string_view content) {
    auto const path = td.path() / name;
    test::write_file(path, content);
    return local_artifact(path);
  }

  test::test_logger lgr;
  test::temporary_directory td;
  std::unique_ptr<file_access const> fa{create_file_access_generic()};
  std::shared_ptr<test::os_access_mock> os{
      test::os_access_mock::create_test_instance()};
  credential_store store;
  std::unique_ptr<credential_manager> creds;
  ::testing::StrictMock<form_submitter_mock> forms;
};

} // namespace

TEST(link_follower_detail, classify_content) {
  using detail::classify_content;

  EXPECT_EQ(content_class::NONE, classify_content("", "x"));
  EXPECT_EQ(content_class::NONE, classify_content("just some text\n", "x"));
  EXPECT_EQ(content_class::INDIRECTION_LIST,
            classify_content("\xEF\xBB\xBF  http://h/a\nhttp://h/b\n", "list"));
  EXPECT_EQ(content_class::INDIRECTION_LIST,
            classify_content("s3://bucket/key\n", "index.html"));
  EXPECT_EQ(content_class::NONE,
            classify_content("http://h/a is not a list\n", "notes"));
  EXPECT_EQ(content_class::RESOURCE_LISTING,
            classify_content("<?xml version=\"1.0\"?>\n<!-- c -->\n"
                             "<feed xmlns=\"http://www.w3.org/2005/Atom\">",
                             "data.xml"));
  EXPECT_EQ(content_class::RESOURCE_LISTING,
            classify_content("<?xml version=\"1.0\"?><ml:metalink>", "x.meta4"));
  EXPECT_EQ(content_class::NONE,
            classify_content("<?xml version=\"1.0\"?><rss>", "x.xml"));
  EXPECT_EQ(content_class::HYPERTEXT,
            classify_content("<!DOCTYPE html><html></html>", "dir"));
  EXPECT_EQ(content_class::HYPERTEXT, classify_content("anything", "page.PHP"));
  EXPECT_EQ(content_class::HYPERTEXT,
            classify_content("<html><body>x</body></html>", "data.csv"));
  EXPECT_EQ(content_class::HYPERTEXT,
            classify_content(R"(<html><head><meta http-equiv="refresh" )"
                             R"(content="10"></head></html>)",
                             "product.zip"));
  EXPECT_EQ(content_class::LOGIN_PAGE,
            classify_content(kLoginPage, "index.html"));
  EXPECT_EQ(content_class::LOGIN_PAGE,
            classify_content(kLoginPage, "download"));
  EXPECT_EQ(content_class::LOGIN_PAGE, classify_content(kLoginPage, "data.nc"));
  EXPECT_EQ(content_class::HYPERTEXT,
            classify_content(std::string(kLoginPage) +
                                 R"(<meta http-equiv="refresh" content="5">)",
                             "index.html"));
}

TEST(link_follower_detail, classify_large_login_page) {
  std::string page{R"(<html><body><form method="post" action="/login">)"};

  while (page.size() < 95 * 1024) {
    page += "<p>Please enter your institutional account details.</p>\n";
  }

  page += R"(<input type="password" name="pw"></form></body></html>)";

  EXPECT_EQ(content_class::LOGIN_PAGE,
            detail::classify_content(page, "data.nc"));
  EXPECT_EQ(content_class::HYPERTEXT,
            detail::classify_content(std::string(60 * 1024, 'x') + "<a href=",
                                     "page.html"));
}

TEST(link_follower_detail, indirection_list) {
  EXPECT_THAT(detail::indirection_list("  http://h/a \n# comment\n\r\n"
                                       "ftp://h/b\r\n"),
              ElementsAre("http://h/a", "ftp://h/b"));
}

TEST(link_follower_detail, attribute_values) {
  constexpr std::string_view html{
      R"(<a href="one.txt">1</a><A HREF='two.txt'>2</A><a name=x>)"
      R"(<link href=style.css><a class="y" href="q?a=1&amp;b=2">)"};

  EXPECT_THAT(detail::attribute_values(html, "a", "href"),
              ElementsAre("one.txt", "two.txt", "q?a=1&b=2"));
  EXPECT_THAT(detail::attribute_values(html, "", "href"),
              ElementsAre("one.txt", "two.txt", "style.css", "q?a=1&b=2"));
}

TEST(link_follower_detail, meta_refresh) {
  auto r1 = detail::find_meta_refresh(
      R"(<meta http-equiv="Refresh" content="5; URL='/ready/data.csv'">)");
  ASSERT_TRUE(r1);
  EXPECT_EQ(5s, r1->delay);
  EXPECT_EQ("/ready/data.csv", r1->target);

  auto r2 = detail::find_meta_refresh(
      R"(<meta charset="utf-8"><meta http-equiv=refresh content="30">)");
  ASSERT_TRUE(r2);
  EXPECT_EQ(30s, r2->delay);
  EXPECT_EQ("", r2->target);

  auto r3 =
      detail::find_meta_refresh(R"(<meta http-equiv="refresh" content="x">)");
  ASSERT_TRUE(r3);
  EXPECT_EQ(0s, r3->delay);

  EXPECT_FALSE(detail::find_meta_refresh(R"(<meta name="refresh">)"));
}

TEST(link_follower_detail, login_form) {
  auto form = detail::find_login_form(kLoginPage);
  ASSERT_TRUE(form);
  EXPECT_EQ("/idp/profile/SAML2/Login", form->action);
  EXPECT_EQ("j_username", form->user_field);
  EXPECT_EQ("j_password", form->password_field);
  EXPECT_THAT(form->hidden, ElementsAre(Pair("csrf_token", "a&b")));

  // search forms and forms without a password field do not count
  EXPECT_FALSE(detail::find_login_form(
      R"(<form action="/search"><input type="password" name="p"></form>)"));
  EXPECT_FALSE(detail::find_login_form(
      R"(<form action="/login"><input type="text" name="u"></form>)"));

  auto defaults = detail::find_login_form(
      R"(<form action="https://sso/signin"><input type=password></form>)");
  ASSERT_TRUE(defaults);
  EXPECT_EQ("username", defaults->user_field);
  EXPECT_EQ("password", defaults->password_field);
}

TEST(link_follower_detail, resolve_references) {
  auto base = uri::parse("http://h/pub/dir/index.html");

  EXPECT_THAT(detail::resolve_references(
                  base, {"a.txt", "sub/", "#top", "?C=M;O=A", "mailto:x@y",
                         "javascript:void(0)", "../", "/pub/", "a.txt",
                         "http://mirror/other/a.txt", "index.html",
                         "http://other/file.bin"}),
              ElementsAre("http://h/pub/dir/a.txt", "http://h/pub/dir/sub/",
                          "http://other/file.bin"));
}

TEST_F(link_follower_test, large_and_non_regular_artifacts_are_kept) {
  auto follower = make_follower();
  auto cur = uri::parse("http://h/big");

  auto big = put("big", std::string(kLinkFollowMaxSize, 'h').insert(0, "http://h/x\n"));
  auto out = follower.follow(cur, big);
  EXPECT_EQ(action::KEEP, out.act);
  EXPECT_EQ(content_class::NONE, out.kind);
  EXPECT_TRUE(big.exists());

  fs::create_directory(td.path() / "dir");
  local_artifact dir(td.path() / "dir");
  EXPECT_EQ(action::KEEP, follower.follow(cur, dir).act);
}

TEST_F(link_follower_test, indirection_list_is_followed) {
  auto follower = make_follower();
  auto art = put("list.txt", "http://h/a\n\n# skip\ns3://b/k\n");

  auto out = follower.follow(uri::parse("http://h/list.txt"), art);

  EXPECT_EQ(action::FOLLOW, out.act);
  EXPECT_EQ(content_class::INDIRECTION_LIST, out.kind);
  EXPECT_THAT(out.discovered, ElementsAre("http://h/a", "s3://b/k"));
  EXPECT_FALSE(art.exists());
  EXPECT_FALSE(fs::exists(td.path() / "list.txt"));
}

TEST_F(link_follower_test, feed_entries_are_resolved) {
  auto follower = make_follower();
  auto art = put("feed.xml", R"(<?xml version="1.0" encoding="utf-8"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <link href="http://h/feeds/feed.xml" rel="self"/>
  <entry><link href="granule1.nc"/></entry>
  <entry><link href="http://data/granule2.nc"/></entry>
</feed>
)");

  auto out = follower.follow(uri::parse("http://h/feeds/feed.xml"), art);

  EXPECT_EQ(action::FOLLOW, out.act);
  EXPECT_EQ(content_class::RESOURCE_LISTING, out.kind);
  EXPECT_THAT(out.discovered, ElementsAre("http://h/feeds/granule1.nc",
                                          "http://data/granule2.nc"));
}

TEST_F(link_follower_test, directory_listing_is_followed) {
  auto follower = make_follower();
  auto art = put("data", R"(<!DOCTYPE html>
<html><body><h1>Index of /data</h1>
<a href="?C=N;O=D">Name</a>
<a href="/">Parent Directory</a>
<a href="a.nc">a.nc</a>
<a href="b.nc">b.nc</a>
</body></html>
)");

  auto out = follower.follow(uri::parse("http://h/data/"), art);

  EXPECT_EQ(action::FOLLOW, out.act);
  EXPECT_EQ(content_class::HYPERTEXT, out.kind);
  EXPECT_THAT(out.discovered, ElementsAre("http://h/data/a.nc", "http://h/data/b.nc"));
  EXPECT_TRUE(lgr.contains(logger::INFO, "following 2 links from hypertext"));
}

TEST_F(link_follower_test, page_without_links_is_kept) {
  auto follower = make_follower();
  auto art = put("page.html", "<html><body>nothing here</body></html>");

  auto out = follower.follow(uri::parse("http://h/page.html"), art);

  EXPECT_EQ(action::KEEP, out.act);
  EXPECT_EQ(content_class::HYPERTEXT, out.kind);
  EXPECT_TRUE(art.exists());
}

TEST_F(link_follower_test, refresh_to_same_resource_requeues) {
  auto follower = make_follower();
  auto art = put("result", R"(<html><head>
<meta http-equiv="refresh" content="15">
</head><body>your order is being prepared</body></html>)");

  auto out = follower.follow(uri::parse("http://h/order/42/result"), art);

  EXPECT_EQ(action::REQUEUE, out.act);
  EXPECT_THAT(out.discovered, IsEmpty());
  EXPECT_FALSE(art.exists());
  EXPECT_THAT(os->get_sleeps(), ElementsAre(15s));
}

TEST_F(link_follower_test, refresh_to_other_resource_is_followed) {
  auto follower = make_follower();
  auto art = put("result", R"(<html><head>
<meta http-equiv="refresh" content="0; url=done/data.zip">
</head></html>)");

  auto out = follower.follow(uri::parse("http://h/order/42/result"), art);

  EXPECT_EQ(action::FOLLOW, out.act);
  EXPECT_THAT(out.discovered, ElementsAre("http://h/order/42/done/data.zip"));
  EXPECT_THAT(os->get_sleeps(), IsEmpty());
}

TEST_F(link_follower_test, successful_login) {
  auto follower = make_follower();
  auto art = put("data.nc", kLoginPage);
  auto const path = art.path();

  EXPECT_CALL(forms,
              submit(Property(&uri::str, "https://sso.example.org/idp/profile/SAML2/Login"),
                     ElementsAre(Pair("csrf_token", "a&b"),
                                 Pair("j_username", "alice"),
                                 Pair("j_password", "pw")),
                     path, _))
      .WillOnce(Invoke([](uri const&, form_fields const&, fs::path const& dest,
                          credential const&) {
        test::write_file(dest, std::string(2 * kLinkFollowMaxSize, 'x'));
        return transfer_result::success();
      }));

  auto out = follower.follow(uri::parse("https://sso.example.org/data.nc"), art);

  EXPECT_EQ(action::KEEP, out.act);
  EXPECT_EQ(content_class::LOGIN_PAGE, out.kind);
  EXPECT_TRUE(art.is_regular());
  EXPECT_EQ(2 * kLinkFollowMaxSize, art.size());
}

TEST_F(link_follower_test, login_page_without_suffix_is_submitted) {
  auto follower = make_follower();
  auto art = put("download", kLoginPage);

  EXPECT_CALL(forms, submit(_, _, art.path(), _))
      .WillOnce(Invoke([](uri const&, form_fields const&, fs::path const& dest,
                          credential const&) {
        test::write_file(dest, std::string(2 * kLinkFollowMaxSize, 'x'));
        return transfer_result::success();
      }));

  auto out =
      follower.follow(uri::parse("https://sso.example.org/download"), art);

  EXPECT_EQ(action::KEEP, out.act);
  EXPECT_EQ(content_class::LOGIN_PAGE, out.kind);
  EXPECT_THAT(out.discovered, IsEmpty());
}

TEST_F(link_follower_test, login_still_redirected) {
  auto follower = make_follower();
  auto art = put("data.nc", kLoginPage);

  EXPECT_CALL(forms, submit(_, _, _, _))
      .WillOnce(Invoke([](uri const&, form_fields const&, fs::path const& dest,
                          credential const&) {
        test::write_file(dest, kLoginPage);
        return transfer_result::success();
      }));

  auto out = follower.follow(uri::parse("https://sso.example.org/data.nc"), art);

  EXPECT_EQ(action::FAILED, out.act);
  EXPECT_EQ(kStatusFatal, out.result.status);
  EXPECT_THAT(out.result.message, HasSubstr("still redirected"));
  EXPECT_TRUE(lgr.contains(logger::ERROR, "authentication failed"));
}

TEST_F(link_follower_test, login_request_fails) {
  auto follower = make_follower();
  auto art = put("data.nc", kLoginPage);

  EXPECT_CALL(forms, submit(_, _, _, _))
      .WillOnce(Return(transfer_result::failure(22, "HTTP 403")));

  auto out = follower.follow(uri::parse("https://sso.example.org/data.nc"), art);

  EXPECT_EQ(action::FAILED, out.act);
  EXPECT_THAT(out.result.message, HasSubstr("HTTP 403"));
}

TEST_F(link_follower_test, login_without_credentials) {
  auto follower = make_follower(credential_options{.quiet = true});
  auto art = put("data.nc", kLoginPage);

  auto out = follower.follow(uri::parse("https://sso.example.org/data.nc"), art);

  EXPECT_EQ(action::FAILED, out.act);
  EXPECT_THAT(out.result.message,
              HasSubstr("no credentials available for sso.example.org"));
}
