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
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <urifetch/archive_transform.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/file_access_generic.h>
#include <urifetch/local_artifact.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace urifetch;
using ::testing::IsSupersetOf;

namespace fs = std::filesystem;

namespace {

std::set<std::string> list_tgz(fs::path const& path) {
  std::set<std::string> rv;
  std::unique_ptr<struct ::archive, decltype(&::archive_read_free)> a{
      ::archive_read_new(), ::archive_read_free};

  ::archive_read_support_filter_gzip(a.get());
  ::archive_read_support_format_tar(a.get());

  if (::archive_read_open_filename(a.get(), path.c_str(), 10240) !=
      ARCHIVE_OK) {
    return rv;
  }

  struct ::archive_entry* ae{nullptr};

  while (::archive_read_next_header(a.get(), &ae) == ARCHIVE_OK) {
    std::string name{::archive_entry_pathname(ae)};
    // directories may carry a trailing slash
    if (name.size() > 1 && name.ends_with('/')) {
      name.pop_back();
    }
    rv.insert(std::move(name));
    ::archive_read_data_skip(a.get());
  }

  return rv;
}

class archive_transform_test : public ::testing::Test {
 protected:
  test::test_logger lgr;
  test::temporary_directory td;
  std::unique_ptr<file_access const> fa{create_file_access_generic()};
  archive_transform at{lgr, *fa};

  fs::path out() const { return td.path(); }
};

} // namespace

TEST(archive_transform_actions, uncompress_action) {
  EXPECT_EQ(archive_action::GUNZIP, archive_transform::uncompress_action("a.gz"));
  EXPECT_EQ(archive_action::UNTAR, archive_transform::uncompress_action("a.tgz"));
  EXPECT_EQ(archive_action::UNTAR,
            archive_transform::uncompress_action("a.TAR.GZ"));
  EXPECT_EQ(archive_action::UNZIP, archive_transform::uncompress_action("a.Zip"));
  EXPECT_EQ(archive_action::NONE, archive_transform::uncompress_action("a.tar"));
  EXPECT_EQ(archive_action::NONE, archive_transform::uncompress_action("gz"));
  EXPECT_EQ("untar", archive_action_name(archive_action::UNTAR));
}

TEST(archive_transform_actions, compress_action) {
  EXPECT_EQ(archive_action::GZIP,
            archive_transform::compress_action("data.csv", false));
  EXPECT_EQ(archive_action::TAR,
            archive_transform::compress_action("data.zip", true));
  for (auto name : {"a.gz", "a.TGZ", "a.zip", "a.bz2", "a.xz", "a.zst", "a.7z",
                    "a.tar", "a.lz4", "a.Z"}) {
    EXPECT_EQ(archive_action::NONE,
              archive_transform::compress_action(name, false))
        << name;
  }
  EXPECT_EQ(archive_action::GZIP,
            archive_transform::compress_action("a.z", false));
}

TEST_F(archive_transform_test, gunzip_in_place) {
  auto const gz = out() / "data.csv.gz";
  test::write_archive(gz, test::archive_format::GZ,
                      {{"data.csv", "a,b\n1,2\n"}});

  local_artifact art(gz);
  EXPECT_EQ(archive_action::GUNZIP, at.uncompress(art, out()));

  EXPECT_EQ(out() / "data.csv", art.path());
  EXPECT_TRUE(art.is_regular());
  EXPECT_EQ("a,b\n1,2\n", test::read_file(art.path()));
  EXPECT_FALSE(fs::exists(gz));
}

TEST_F(archive_transform_test, corrupt_gzip) {
  auto const gz = out() / "broken.gz";
  test::write_file(gz, "this is not gzip data");

  local_artifact art(gz);
  EXPECT_THROW(at.uncompress(art, out()), archive_error);
  EXPECT_TRUE(fs::exists(gz));
}

TEST_F(archive_transform_test, untar_into_output_dir) {
  auto const tgz = out() / "pkg-1.0.tgz";
  test::write_archive(tgz, test::archive_format::TGZ,
                      {{"pkg-1.0/", ""},
                       {"pkg-1.0/README", "readme"},
                       {"pkg-1.0/src/main.c", "int main() {}"}});

  local_artifact art(tgz);
  EXPECT_EQ(archive_action::UNTAR, at.uncompress(art, out()));

  EXPECT_EQ(out() / "pkg-1.0", art.path());
  EXPECT_TRUE(art.is_directory());
  EXPECT_EQ("readme", test::read_file(out() / "pkg-1.0" / "README"));
  EXPECT_EQ("int main() {}",
            test::read_file(out() / "pkg-1.0" / "src" / "main.c"));
  EXPECT_FALSE(fs::exists(tgz));
}

TEST_F(archive_transform_test, unzip_hoists_single_entry) {
  auto const zip = out() / "bundle.zip";
  test::write_archive(zip, test::archive_format::ZIP,
                      {{"report.pdf", "%PDF-1.4"}});

  local_artifact art(zip);
  EXPECT_EQ(archive_action::UNZIP, at.uncompress(art, out()));

  EXPECT_EQ(out() / "report.pdf", art.path());
  EXPECT_EQ("%PDF-1.4", test::read_file(art.path()));
  EXPECT_FALSE(fs::exists(out() / "bundle"));
  EXPECT_FALSE(fs::exists(zip));
}

TEST_F(archive_transform_test, unzip_hoists_directory_of_same_name) {
  auto const zip = out() / "data.zip";
  test::write_archive(zip, test::archive_format::ZIP,
                      {{"data/", ""},
                       {"data/a.txt", "a"},
                       {"data/b.txt", "b"}});

  local_artifact art(zip);
  at.uncompress(art, out());

  EXPECT_EQ(out() / "data", art.path());
  EXPECT_TRUE(art.is_directory());
  EXPECT_EQ("a", test::read_file(out() / "data" / "a.txt"));
  EXPECT_FALSE(fs::exists(out() / "data" / "data"));
}

TEST_F(archive_transform_test, unzip_multiple_entries_into_wrapper) {
  auto const zip = out() / "bundle.zip";
  test::write_archive(zip, test::archive_format::ZIP,
                      {{"a.txt", "a"}, {"b/c.txt", "c"}});

  local_artifact art(zip);
  at.uncompress(art, out());

  EXPECT_EQ(out() / "bundle", art.path());
  EXPECT_TRUE(art.is_directory());
  EXPECT_EQ("a", test::read_file(out() / "bundle" / "a.txt"));
  EXPECT_EQ("c", test::read_file(out() / "bundle" / "b" / "c.txt"));
}

TEST_F(archive_transform_test, unzip_hoist_target_exists) {
  auto const zip = out() / "bundle.zip";
  test::write_archive(zip, test::archive_format::ZIP, {{"report.pdf", "new"}});
  test::write_file(out() / "report.pdf", "old");

  local_artifact art(zip);
  EXPECT_THROW(at.uncompress(art, out()), archive_error);
  EXPECT_EQ("old", test::read_file(out() / "report.pdf"));
}

TEST_F(archive_transform_test, unzip_empty_archive) {
  auto const zip = out() / "empty.zip";
  test::write_archive(zip, test::archive_format::ZIP, {});

  local_artifact art(zip);
  EXPECT_THROW(at.uncompress(art, out()), archive_error);
  EXPECT_FALSE(fs::exists(out() / "empty"));
}

TEST_F(archive_transform_test, unzip_refuses_unsafe_paths) {
  auto const zip = out() / "evil.zip";
  test::write_archive(zip, test::archive_format::ZIP,
                      {{"../escaped.txt", "gotcha"}});

  local_artifact art(zip);
  EXPECT_THROW(at.uncompress(art, out()), archive_error);
  EXPECT_FALSE(fs::exists(out().parent_path() / "escaped.txt"));
  EXPECT_FALSE(fs::exists(out() / "evil"));
}

TEST_F(archive_transform_test, uncompress_leaves_other_files_alone) {
  test::write_file(out() / "plain.txt", "x");
  local_artifact art(out() / "plain.txt");

  EXPECT_EQ(archive_action::NONE, at.uncompress(art, out()));
  EXPECT_EQ(out() / "plain.txt", art.path());
}

TEST_F(archive_transform_test, gzip_file) {
  test::write_file(out() / "data.csv", "x,y\n");
  local_artifact art(out() / "data.csv");

  EXPECT_EQ(archive_action::GZIP, at.compress(art));

  EXPECT_EQ(out() / "data.csv.gz", art.path());
  EXPECT_TRUE(art.is_regular());
  EXPECT_FALSE(fs::exists(out() / "data.csv"));

  // and back again
  EXPECT_EQ(archive_action::GUNZIP, at.uncompress(art, out()));
  EXPECT_EQ("x,y\n", test::read_file(out() / "data.csv"));
}

TEST_F(archive_transform_test, tar_directory) {
  fs::create_directories(out() / "tree" / "sub");
  test::write_file(out() / "tree" / "a.txt", "a");
  test::write_file(out() / "tree" / "sub" / "b.txt", "b");

  local_artifact art(out() / "tree");
  EXPECT_EQ(archive_action::TAR, at.compress(art));

  EXPECT_EQ(out() / "tree.tgz", art.path());
  EXPECT_FALSE(fs::exists(out() / "tree"));
  EXPECT_THAT(list_tgz(art.path()),
              IsSupersetOf({"tree", "tree/a.txt", "tree/sub", "tree/sub/b.txt"}));
}

TEST_F(archive_transform_test, tar_linked_directory) {
  test::temporary_directory src;
  test::write_file(src.path() / "f.txt", "f");
  fs::create_directory_symlink(src.path(), out() / "linked");

  local_artifact art(out() / "linked");
  EXPECT_EQ(archive_action::TAR, at.compress(art));

  EXPECT_THAT(list_tgz(out() / "linked.tgz"),
              IsSupersetOf({"linked", "linked/f.txt"}));
  EXPECT_FALSE(fs::exists(fs::symlink_status(out() / "linked")));
  EXPECT_TRUE(fs::exists(src.path() / "f.txt"));
}

TEST_F(archive_transform_test, compress_leaves_archives_alone) {
  test::write_file(out() / "x.zip", "PK");
  local_artifact art(out() / "x.zip");

  EXPECT_EQ(archive_action::NONE, at.compress(art));
  EXPECT_EQ(out() / "x.zip", art.path());
}
