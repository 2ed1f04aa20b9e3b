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
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <urifetch/driver.h>
#include <urifetch/driver_registry.h>
#include <urifetch/error.h>
#include <urifetch/glob_matcher.h>
#include <urifetch/run_options.h>
#include <urifetch/uri.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace urifetch;
using ::testing::Contains;
using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::HasSubstr;
using ::testing::Not;

namespace fs = std::filesystem;

namespace {

class drivers_test : public ::testing::Test {
 protected:
  test::test_logger lgr;
  driver_registry registry{lgr};
  run_options opts;
  test::job_control_mock jobs;
  std::shared_ptr<test::os_access_mock> os{
      test::os_access_mock::create_test_instance()};
  std::optional<credential> cred;
  fs::path jar{"/cfg/cookies.txt"};

  void SetUp() override {
    opts.retries = 2;
    opts.retry_delay = std::chrono::seconds(5);
    opts.timeout = std::chrono::seconds(30);
  }

  transfer_result fetch(std::string_view u, fs::path const& dest) {
    auto src = uri::parse(u);
    transfer_context ctx{opts, jobs, *os, jar, cred};
    return registry.resolve(src.driver_name()).transfer(src, dest, ctx);
  }

  std::vector<std::string> const& args(size_t i = 0) const {
    return jobs.commands().at(i).args;
  }
};

} // namespace

TEST_F(drivers_test, builtin_schemes) {
  for (auto scheme : {"file", "http", "https", "ftp", "ftps", "scp", "sftp",
                      "s3", "gsiftp", "hdfs"}) {
    EXPECT_TRUE(registry.has_driver(scheme)) << scheme;
  }

  EXPECT_TRUE(registry.has_driver("HTTPS"));
  EXPECT_FALSE(registry.has_driver("gopher"));
  EXPECT_THROW(registry.resolve("gopher"), no_driver_error);
  EXPECT_EQ("curl", registry.resolve("ftp").name());
}

TEST_F(drivers_test, for_each_driver_is_sorted) {
  std::vector<std::string> schemes;
  registry.for_each_driver(
      [&](std::string const& scheme, driver const&) { schemes.push_back(scheme); });

  EXPECT_THAT(schemes, ElementsAre("file", "ftp", "ftps", "gsiftp", "hdfs",
                                   "http", "https", "s3", "scp", "sftp"));
}

TEST_F(drivers_test, curl_command_line) {
  cred = credential{"alice", "secret"};
  jobs.add_result({0, "200", ""});

  auto res = fetch("https://example.org/data.csv", "/out/data.csv");

  EXPECT_TRUE(res.ok()) << res.message;
  ASSERT_EQ(1, jobs.commands().size());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"curl", "-L", "-f", "-sS", "-w", "%{http_code}",
                           "--connect-timeout", "30", "-b", "/cfg/cookies.txt",
                           "-c", "/cfg/cookies.txt", "-K", "-", "--retry",
                           "2", "--retry-delay", "5", "-o", "/out/data.csv",
                           "https://example.org/data.csv"}));
  EXPECT_EQ("user = \"alice:secret\"\n", jobs.commands()[0].input);
  EXPECT_THAT(args(), Each(Not(HasSubstr("secret"))));
}

TEST_F(drivers_test, curl_config_quoting) {
  cred = credential{"bob", "a\"b\\c"};

  EXPECT_TRUE(fetch("ftp://host/pub/x", "/out/x").ok());
  EXPECT_EQ("user = \"bob:a\\\"b\\\\c\"\n", jobs.commands()[0].input);
}

TEST_F(drivers_test, curl_ftp_has_no_cookie_jar) {
  opts.retries = 0;
  opts.timeout = std::chrono::seconds(0);

  EXPECT_TRUE(fetch("ftp://host/pub/x", "/out/x").ok());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"curl", "-L", "-f", "-sS", "-w", "%{http_code}",
                           "-o", "/out/x", "ftp://host/pub/x"}));
}

TEST_F(drivers_test, curl_not_found) {
  jobs.add_result({22, "404", "curl: (22) The requested URL returned error: 404"});
  EXPECT_EQ(kStatusNotFound, fetch("http://h/missing", "/out/missing").status);

  jobs.add_result({78, "000", "curl: (78) RETR response: 550"});
  EXPECT_EQ(kStatusNotFound, fetch("ftp://h/missing", "/out/missing").status);
}

TEST_F(drivers_test, curl_other_http_error) {
  jobs.add_result({22, "500", "curl: (22) The requested URL returned error: 500"});
  auto res = fetch("http://h/broken", "/out/broken");
  EXPECT_EQ(22, res.status);
  EXPECT_THAT(res.message, HasSubstr("500"));
}

TEST_F(drivers_test, curl_generic_failure_is_not_not_found) {
  jobs.add_result({1, "", ""});
  auto res = fetch("http://h/x", "/out/x");
  EXPECT_EQ(2, res.status);
  EXPECT_FALSE(res.not_found());
}

TEST_F(drivers_test, curl_killed) {
  jobs.add_result({kStatusTimeout, "", "", true});
  EXPECT_EQ(kStatusTimeout, fetch("http://h/slow", "/out/slow").status);
}

TEST_F(drivers_test, curl_form_submission) {
  auto src = uri::parse("https://idp.example.org/login");
  transfer_context ctx{opts, jobs, *os, jar, cred};
  form_fields fields{{"csrf", "tok"}, {"user", "alice"}, {"password", "pw1"}};

  auto res = registry.resolve("https").submit_form(src, fields, "/out/page", ctx);

  EXPECT_TRUE(res.ok());
  EXPECT_EQ("data-urlencode = \"csrf=tok\"\n"
            "data-urlencode = \"user=alice\"\n"
            "data-urlencode = \"password=pw1\"\n",
            jobs.commands()[0].input);
  EXPECT_EQ("https://idp.example.org/login", args().back());
  EXPECT_THAT(args(), Each(Not(HasSubstr("pw1"))));
}

TEST_F(drivers_test, form_submission_unsupported) {
  auto src = uri::parse("s3://bucket/login");
  transfer_context ctx{opts, jobs, *os, jar, cred};

  auto res = registry.resolve("s3").submit_form(src, {}, "/out/x", ctx);
  EXPECT_EQ(kStatusFatal, res.status);
  EXPECT_THAT(res.message, HasSubstr("does not support form submission"));
}

TEST_F(drivers_test, scp_command_line) {
  cred = credential{"bob", "unused"};
  opts.retries = 0;

  EXPECT_TRUE(fetch("sftp://host:2222/data/file%201.txt", "/out/f").ok());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"scp", "-B", "-q", "-r", "-o", "ConnectTimeout=30",
                           "-P", "2222", "-s", "bob@host:/data/file 1.txt",
                           "/out/f"}));
}

TEST_F(drivers_test, scp_user_from_uri) {
  cred = credential{"bob", "unused"};
  EXPECT_TRUE(fetch("scp://carol@host/x", "/out/x").ok());
  EXPECT_THAT(args(), Contains("carol@host:/x"));
}

TEST_F(drivers_test, scp_retries_in_adapter) {
  jobs.add_result({1, "", "ssh: connect to host h: Connection refused"});
  jobs.add_result({1, "", "ssh: connect to host h: Connection refused"});

  auto res = fetch("scp://h/x", "/out/x");

  EXPECT_TRUE(res.ok());
  EXPECT_EQ(3, jobs.commands().size());
  EXPECT_THAT(os->get_sleeps(),
              ElementsAre(std::chrono::milliseconds(5000),
                          std::chrono::milliseconds(5000)));
}

TEST_F(drivers_test, scp_gives_up_after_retries) {
  for (int i = 0; i < 3; ++i) {
    jobs.add_result({1, "", "lost connection"});
  }

  auto res = fetch("scp://h/x", "/out/x");

  EXPECT_EQ(2, res.status);
  EXPECT_EQ("lost connection", res.message);
  EXPECT_EQ(3, jobs.commands().size());
}

TEST_F(drivers_test, scp_not_found_is_not_retried) {
  jobs.add_result({1, "", "scp: /x: No such file or directory"});

  EXPECT_EQ(kStatusNotFound, fetch("scp://h/x", "/out/x").status);
  EXPECT_EQ(1, jobs.commands().size());
}

TEST_F(drivers_test, s3_command_line) {
  EXPECT_TRUE(fetch("s3://bucket/prefix/", "/out/prefix").ok());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"aws", "s3", "cp", "--only-show-errors",
                           "--cli-connect-timeout", "30", "--recursive",
                           "s3://bucket/prefix/", "/out/prefix"}));
}

TEST_F(drivers_test, s3_not_found) {
  jobs.add_result(
      {1, "", "fatal error: An error occurred (404) when calling HeadObject"});
  EXPECT_EQ(kStatusNotFound, fetch("s3://bucket/key", "/out/key").status);
  EXPECT_EQ(1, jobs.commands().size());
}

TEST_F(drivers_test, gsiftp_command_line) {
  os->setenv("X509_USER_PROXY", "/tmp/x509up_u1000");

  EXPECT_TRUE(fetch("gsiftp://grid.example.org/data/", "/out/data").ok());
  ASSERT_EQ(1, jobs.commands().size());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"globus-url-copy", "-cd", "-rst", "-rst-retries",
                           "2", "-rst-interval", "5", "-stall-timeout", "30",
                           "-r", "gsiftp://grid.example.org/data/",
                           "file:///out/data/"}));
  EXPECT_EQ("/tmp/x509up_u1000",
            jobs.commands()[0].env.at("X509_USER_PROXY"));
  EXPECT_FALSE(jobs.commands()[0].env.contains("X509_USER_CERT"));
}

TEST_F(drivers_test, gsiftp_without_certificate_variables) {
  test::test_logger vlgr(logger::VERBOSE);
  driver_registry vreg(vlgr);
  auto src = uri::parse("gsiftp://h/f");
  transfer_context ctx{opts, jobs, *os, jar, cred};

  EXPECT_TRUE(vreg.resolve("gsiftp").transfer(src, "/out/f", ctx).ok());
  EXPECT_TRUE(jobs.commands()[0].env.empty());
  EXPECT_TRUE(vlgr.contains(logger::VERBOSE, "X509_USER_"));
}

TEST_F(drivers_test, gsiftp_not_found) {
  jobs.add_result({1, "", "error: globus_ftp_client: the server responded "
                          "with an error 550 No such file or directory."});
  EXPECT_EQ(kStatusNotFound, fetch("gsiftp://h/f", "/out/f").status);
}

TEST_F(drivers_test, file_driver_links_and_copies) {
  test::temporary_directory td;
  auto const src = td.path() / "src.txt";
  test::write_file(src, "hello");

  auto const link = td.path() / "link.txt";
  EXPECT_TRUE(fetch("file://" + src.string(), link).ok());
  EXPECT_TRUE(fs::is_symlink(link));
  EXPECT_EQ(src, fs::read_symlink(link));

  opts.copy_physical = true;
  auto const copy = td.path() / "copy.txt";
  EXPECT_TRUE(fetch("file://" + src.string(), copy).ok());
  EXPECT_FALSE(fs::is_symlink(copy));
  EXPECT_EQ("hello", test::read_file(copy));

  EXPECT_TRUE(jobs.commands().empty());
}

TEST_F(drivers_test, file_driver_directory_copy_with_exclude) {
  test::temporary_directory td;
  auto const src = td.path() / "tree";
  fs::create_directories(src / "sub" / ".git");
  test::write_file(src / "a.txt", "a");
  test::write_file(src / "a.tmp", "tmp");
  test::write_file(src / "sub" / "b.txt", "b");
  test::write_file(src / "sub" / ".git" / "HEAD", "ref");

  std::vector<std::string> patterns{"*.tmp", ".git"};
  glob_matcher exclude(patterns);

  opts.copy_physical = true;
  auto u = uri::parse("file://" + src.string());
  transfer_context ctx{opts, jobs, *os, jar, cred, &exclude};
  auto const dest = td.path() / "out";

  EXPECT_TRUE(registry.resolve("file").transfer(u, dest, ctx).ok());

  EXPECT_EQ("a", test::read_file(dest / "a.txt"));
  EXPECT_EQ("b", test::read_file(dest / "sub" / "b.txt"));
  EXPECT_FALSE(fs::exists(dest / "a.tmp"));
  EXPECT_FALSE(fs::exists(dest / "sub" / ".git"));
}

TEST_F(drivers_test, file_driver_copy_stops_when_cancelled) {
  test::temporary_directory td;
  auto const src = td.path() / "tree";
  fs::create_directories(src / "sub");
  test::write_file(src / "a.txt", "a");
  test::write_file(src / "sub" / "b.txt", "b");

  opts.copy_physical = true;
  jobs.cancel();

  auto file_res = fetch("file://" + (src / "a.txt").string(), td.path() / "a");
  EXPECT_EQ(kStatusAborted, file_res.status);
  EXPECT_THAT(file_res.message, HasSubstr("cancelled"));

  auto const dest = td.path() / "out";
  auto dir_res = fetch("file://" + src.string(), dest);
  EXPECT_EQ(kStatusAborted, dir_res.status);
  EXPECT_FALSE(fs::exists(dest / "a.txt"));
  EXPECT_FALSE(fs::exists(dest / "sub" / "b.txt"));
}

TEST_F(drivers_test, file_driver_missing_source) {
  test::temporary_directory td;
  auto res = fetch("file://" + (td.path() / "nope").string(), td.path() / "x");
  EXPECT_EQ(kStatusNotFound, res.status);
}

TEST_F(drivers_test, file_driver_rejects_remote_host) {
  auto res = fetch("file://otherhost/etc/hosts", "/out/hosts");
  EXPECT_EQ(kStatusFatal, res.status);
}

TEST_F(drivers_test, hdfs_requires_mount) {
  auto res = fetch("hdfs://namenode/data/x", "/out/x");
  EXPECT_EQ(kStatusFatal, res.status);
  EXPECT_THAT(res.message, HasSubstr("URIFETCH_HDFS_MOUNT"));
}

TEST_F(drivers_test, hdfs_reads_through_mount) {
  test::temporary_directory td;
  fs::create_directories(td.path() / "mnt" / "data");
  test::write_file(td.path() / "mnt" / "data" / "x", "payload");
  os->setenv("URIFETCH_HDFS_MOUNT", (td.path() / "mnt").string());
  opts.copy_physical = true;

  auto const dest = td.path() / "x";
  EXPECT_TRUE(fetch("hdfs://namenode/data/x", dest).ok());
  EXPECT_EQ("payload", test::read_file(dest));
}

TEST_F(drivers_test, hdfs_stays_below_mount) {
  test::temporary_directory td;
  fs::create_directories(td.path() / "mnt" / "data");
  test::write_file(td.path() / "secret", "nope");
  test::write_file(td.path() / "mnt" / "data" / "x", "payload");
  os->setenv("URIFETCH_HDFS_MOUNT", (td.path() / "mnt").string());
  opts.copy_physical = true;

  auto res = fetch("hdfs://namenode/../secret", td.path() / "out");
  EXPECT_EQ(kStatusFatal, res.status);
  EXPECT_THAT(res.message, HasSubstr("points outside of URIFETCH_HDFS_MOUNT"));
  EXPECT_FALSE(fs::exists(td.path() / "out"));

  auto const dest = td.path() / "x";
  EXPECT_TRUE(fetch("hdfs://namenode/data/../data/./x", dest).ok());
  EXPECT_EQ("payload", test::read_file(dest));
}

TEST_F(drivers_test, command_driver_from_definitions) {
  registry.load_definitions(R"({
    "drivers": {
      "Rsync": {
        "command": ["rsync", "--timeout={connect_timeout}", "{uri}", "{dest}"],
        "description": "rsync transfers",
        "not_found_exit_codes": [23],
        "retry_in_adapter": true,
        "env": {"RSYNC_PASSWORD": "{password}"}
      }
    }
  })",
                            "inline");

  ASSERT_TRUE(registry.has_driver("rsync"));
  auto& drv = registry.resolve("rsync");
  EXPECT_EQ("rsync transfers", drv.description());
  EXPECT_THAT(drv.tools(), ElementsAre("rsync"));

  cred = credential{"u", "hunter2"};
  jobs.add_result({12, "", "protocol error"});

  auto res = fetch("rsync://host/mod/file", "/out/file");

  EXPECT_TRUE(res.ok());
  ASSERT_EQ(2, jobs.commands().size());
  EXPECT_THAT(args(), ElementsAreArray<std::string>(
                          {"rsync", "--timeout=30", "rsync://host/mod/file",
                           "/out/file"}));
  EXPECT_EQ("hunter2", jobs.commands()[0].env.at("RSYNC_PASSWORD"));
  EXPECT_EQ(1, os->get_sleeps().size());

  jobs.add_result({23, "", "some files vanished"});
  EXPECT_EQ(kStatusNotFound, fetch("rsync://host/mod/gone", "/out/gone").status);
}

TEST_F(drivers_test, command_driver_replaces_builtin) {
  registry.load_definitions(
      R"({"drivers": {"http": {"command": ["wget", "-O", "{dest}", "{uri}"]}}})",
      "inline");

  EXPECT_EQ("http", registry.resolve("http").name());
  EXPECT_EQ("curl", registry.resolve("https").name());

  jobs.add_result({8, "", "server error"});
  auto res = fetch("http://h/x", "/out/x");

  EXPECT_EQ(8, res.status);
  EXPECT_EQ(1, jobs.commands().size());
  EXPECT_THAT(args(), ElementsAre("wget", "-O", "/out/x", "http://h/x"));
}

TEST_F(drivers_test, invalid_definitions) {
  EXPECT_THROW(registry.load_definitions("{not json", "a"), runtime_error);
  EXPECT_THROW(registry.load_definitions(R"({"other": {}})", "b"),
               runtime_error);
  EXPECT_THROW(
      registry.load_definitions(R"({"drivers": {"x": {"command": []}}})", "c"),
      runtime_error);
  EXPECT_THROW(registry.load_definitions(
                   R"({"drivers": {"x": {"command": ["a"], "env": {"K": 1}}}})",
                   "d"),
               runtime_error);
}

TEST_F(drivers_test, definitions_from_file) {
  test::test_file_access fa;
  fa.set_file("/cfg/drivers.json",
              R"({"drivers": {"irods": {"command": ["iget", "{uri}", "{dest}"]}}})");

  registry.load_definitions(fa, "/cfg/drivers.json");
  EXPECT_TRUE(registry.has_driver("irods"));

  EXPECT_THROW(registry.load_definitions(fa, "/cfg/missing.json"),
               system_error);
}
