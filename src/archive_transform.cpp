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

#include <array>
#include <set>
#include <system_error>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include <fmt/format.h>

#include <urifetch/archive_transform.h>
#include <urifetch/error.h>
#include <urifetch/file_access.h>
#include <urifetch/local_artifact.h>
#include <urifetch/logger.h>
#include <urifetch/string.h>
#include <urifetch/util.h>

namespace urifetch {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 10> kCompressedSuffixes{
    ".gz", ".tgz", ".zip", ".bz2", ".xz", ".zst", ".7z", ".tar", ".lz4", ".Z"};

constexpr size_t kCopyBufferSize{64 * 1024};

constexpr int kExtractFlags =
    ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_UNLINK |
    ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
    ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS;

using archive_ptr = std::shared_ptr<struct ::archive>;
using entry_ptr = std::shared_ptr<struct ::archive_entry>;

bool ends_with_icase(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         iequals(str.substr(str.size() - suffix.size()), suffix);
}

std::string strip_suffix(std::string_view name, std::string_view suffix) {
  return std::string(name.substr(0, name.size() - suffix.size()));
}

// Rejects absolute paths and parent directory components.
bool is_safe_entry_path(std::string_view path) {
  if (path.empty() || path.starts_with('/')) {
    return false;
  }

  for (auto const& part : fs::path(std::string(path))) {
    if (part == "..") {
      return false;
    }
  }

  return true;
}

std::string top_level_component(std::string_view path) {
  while (path.starts_with("./")) {
    path.remove_prefix(2);
  }
  return std::string(path.substr(0, path.find('/')));
}

} // namespace

std::string_view archive_action_name(archive_action action) {
  switch (action) {
  case archive_action::NONE:
    return "none";
  case archive_action::GUNZIP:
    return "gunzip";
  case archive_action::UNTAR:
    return "untar";
  case archive_action::UNZIP:
    return "unzip";
  case archive_action::GZIP:
    return "gzip";
  case archive_action::TAR:
    return "tar";
  }
  return "unknown";
}

archive_action archive_transform::uncompress_action(std::string_view name) {
  if (ends_with_icase(name, ".tgz") || ends_with_icase(name, ".tar.gz")) {
    return archive_action::UNTAR;
  }
  if (ends_with_icase(name, ".gz")) {
    return archive_action::GUNZIP;
  }
  if (ends_with_icase(name, ".zip")) {
    return archive_action::UNZIP;
  }
  return archive_action::NONE;
}

archive_action
archive_transform::compress_action(std::string_view name, bool is_dir) {
  if (is_dir) {
    return archive_action::TAR;
  }

  for (auto sfx : kCompressedSuffixes) {
    // `.Z` is the only case sensitive one
    if (sfx == ".Z" ? name.ends_with(sfx) : ends_with_icase(name, sfx)) {
      return archive_action::NONE;
    }
  }

  return archive_action::GZIP;
}

namespace internal {

template <typename LoggerPolicy>
class archive_transform_ final : public archive_transform::impl {
 public:
  archive_transform_(logger& lgr, file_access const& fa)
      : LOG_PROXY_INIT(lgr)
      , fa_{fa} {}

  archive_action uncompress(local_artifact& artifact,
                            fs::path const& output_dir) override {
    if (artifact.is_directory() || !artifact.exists()) {
      return archive_action::NONE;
    }

    auto const name = artifact.path().filename().string();
    auto const action = archive_transform::uncompress_action(name);

    switch (action) {
    case archive_action::GUNZIP:
      gunzip(artifact, strip_suffix(name, ".gz"));
      break;

    case archive_action::UNTAR:
      untar(artifact, output_dir,
            strip_suffix(name, ends_with_icase(name, ".tgz") ? ".tgz"
                                                             : ".tar.gz"));
      break;

    case archive_action::UNZIP:
      unzip(artifact, output_dir, strip_suffix(name, ".zip"));
      break;

    default:
      break;
    }

    return action;
  }

  archive_action compress(local_artifact& artifact) override {
    if (!artifact.exists()) {
      return archive_action::NONE;
    }

    auto const name = artifact.path().filename().string();
    auto const is_dir = fs::is_directory(artifact.path());
    auto const action = archive_transform::compress_action(name, is_dir);

    switch (action) {
    case archive_action::GZIP:
      gzip(artifact);
      break;

    case archive_action::TAR:
      tar(artifact);
      break;

    default:
      LOG_DEBUG << "leaving " << artifact.path().string() << " untouched";
      break;
    }

    return action;
  }

 private:
  void gunzip(local_artifact& artifact, std::string const& target_name) {
    auto const src = artifact.path();
    auto const dest = src.parent_path() / target_name;

    auto ti = LOG_TIMED_VERBOSE;
    ti << "decompressing " << src.string() << " to " << dest.string();

    archive_ptr a{::archive_read_new(), ::archive_read_free};

    check_result(a, ::archive_read_support_filter_gzip(a.get()));
    check_result(a, ::archive_read_support_format_raw(a.get()));
    check_result(a, ::archive_read_open_filename(a.get(), src.c_str(),
                                                 kCopyBufferSize));

    struct ::archive_entry* ae{nullptr};
    check_result(a, ::archive_read_next_header(a.get(), &ae));

    // the raw format accepts anything, including uncompressed data
    if (::archive_filter_code(a.get(), 0) != ARCHIVE_FILTER_GZIP) {
      URIFETCH_THROW(archive_error,
                     fmt::format("{}: not in gzip format", src.string()));
    }

    remove_existing(dest);

    std::error_code ec;
    auto out = fa_.open_output(dest, ec);

    if (ec) {
      URIFETCH_THROW(archive_error,
                     fmt::format("cannot create {}: {}", dest.string(),
                                 ec.message()));
    }

    try {
      std::vector<char> buf(kCopyBufferSize);

      for (;;) {
        auto n = ::archive_read_data(a.get(), buf.data(), buf.size());
        if (n < 0) {
          check_result(a, static_cast<int>(n));
          break;
        }
        if (n == 0) {
          break;
        }
        out->os().write(buf.data(), n);
      }

      out->close(ec);

      if (ec) {
        URIFETCH_THROW(archive_error,
                       fmt::format("cannot write {}: {}", dest.string(),
                                   ec.message()));
      }
    } catch (...) {
      out.reset();
      fs::remove(dest, ec);
      throw;
    }

    check_result(a, ::archive_read_close(a.get()));

    replace(artifact, dest);
  }

  void untar(local_artifact& artifact, fs::path const& output_dir,
             std::string const& stem) {
    auto const src = artifact.path();

    auto ti = LOG_TIMED_VERBOSE;
    ti << "extracting " << src.string() << " into " << output_dir.string();

    extract(src, output_dir);

    replace(artifact, output_dir / stem);
  }

  void unzip(local_artifact& artifact, fs::path const& output_dir,
             std::string const& stem) {
    auto const src = artifact.path();
    auto const wrapper = output_dir / stem;

    auto ti = LOG_TIMED_VERBOSE;
    ti << "extracting " << src.string() << " into " << wrapper.string();

    remove_existing(wrapper);

    std::error_code ec;
    fs::create_directories(wrapper, ec);

    if (ec) {
      URIFETCH_THROW(archive_error,
                     fmt::format("cannot create {}: {}", wrapper.string(),
                                 ec.message()));
    }

    std::set<std::string> top;

    try {
      top = extract(src, wrapper);

      if (top.empty()) {
        URIFETCH_THROW(archive_error,
                       fmt::format("{}: archive is empty", src.string()));
      }
    } catch (...) {
      fs::remove_all(wrapper, ec);
      throw;
    }

    auto result = wrapper;

    if (top.size() == 1) {
      result = hoist(wrapper, *top.begin(), output_dir);
    }

    remove_existing(src);
    artifact.reset(result);
  }

  // Moves the only entry of `wrapper` one level up, replacing `wrapper`.
  fs::path hoist(fs::path const& wrapper, std::string const& entry,
                 fs::path const& output_dir) {
    auto const target = output_dir / entry;
    auto const tmp = fs::path(wrapper.string() + ".urifetch-unzip");

    LOG_DEBUG << "hoisting " << (wrapper / entry).string() << " to "
              << target.string();

    std::error_code ec;

    fs::rename(wrapper, tmp, ec);

    if (!ec) {
      if (target != wrapper && fs::exists(fs::symlink_status(target))) {
        fs::rename(tmp, wrapper, ec);
        URIFETCH_THROW(archive_error,
                       fmt::format("cannot move {} to {}: target exists",
                                   entry, target.string()));
      }
      fs::rename(tmp / entry, target, ec);
    }

    if (ec) {
      URIFETCH_THROW(archive_error,
                     fmt::format("cannot move {} to {}: {}", entry,
                                 target.string(), ec.message()));
    }

    fs::remove_all(tmp, ec);

    if (ec) {
      LOG_WARN << "cannot remove " << tmp.string() << ": " << ec.message();
    }

    return target;
  }

  // Extracts `src` below `dest_dir`, returning the top level entry names.
  std::set<std::string> extract(fs::path const& src, fs::path const& dest_dir) {
    archive_ptr a{::archive_read_new(), ::archive_read_free};
    archive_ptr ext{::archive_write_disk_new(), ::archive_write_free};

    check_result(a, ::archive_read_support_filter_all(a.get()));
    check_result(a, ::archive_read_support_format_all(a.get()));
    check_result(ext, ::archive_write_disk_set_options(ext.get(), kExtractFlags));
    check_result(ext, ::archive_write_disk_set_standard_lookup(ext.get()));
    check_result(a, ::archive_read_open_filename(a.get(), src.c_str(),
                                                 kCopyBufferSize));

    std::set<std::string> top;
    struct ::archive_entry* ae{nullptr};

    for (;;) {
      auto res = ::archive_read_next_header(a.get(), &ae);

      if (res == ARCHIVE_EOF) {
        break;
      }

      check_result(a, res);

      std::string path{::archive_entry_pathname(ae)};

      if (!is_safe_entry_path(path)) {
        URIFETCH_THROW(archive_error,
                       fmt::format("{}: refusing to extract unsafe path '{}'",
                                   src.string(), path));
      }

      if (auto component = top_level_component(path);
          !component.empty() && component != ".") {
        top.insert(component);
      }

      LOG_TRACE << "extracting " << path;

      ::archive_entry_set_pathname(ae, (dest_dir / path).c_str());

      if (auto const* link = ::archive_entry_hardlink(ae)) {
        if (!is_safe_entry_path(link)) {
          URIFETCH_THROW(archive_error,
                         fmt::format("{}: refusing unsafe hard link '{}'",
                                     src.string(), link));
        }
        ::archive_entry_set_hardlink(ae, (dest_dir / link).c_str());
      }

      check_result(ext, ::archive_write_header(ext.get(), ae));

      if (::archive_entry_size(ae) > 0) {
        copy_data(a, ext);
      }

      check_result(ext, ::archive_write_finish_entry(ext.get()));
    }

    check_result(a, ::archive_read_close(a.get()));
    check_result(ext, ::archive_write_close(ext.get()));

    return top;
  }

  void copy_data(archive_ptr const& ar, archive_ptr const& aw) {
    void const* buf{nullptr};
    size_t size{0};
    la_int64_t offset{0};

    for (;;) {
      auto res = ::archive_read_data_block(ar.get(), &buf, &size, &offset);
      if (res == ARCHIVE_EOF) {
        return;
      }
      check_result(ar, res);
      auto wr = ::archive_write_data_block(aw.get(), buf, size, offset);
      if (wr < ARCHIVE_OK) {
        check_result(aw, static_cast<int>(wr));
      }
    }
  }

  void gzip(local_artifact& artifact) {
    auto const src = artifact.path();
    auto const dest = fs::path(src.string() + ".gz");

    auto ti = LOG_TIMED_VERBOSE;
    ti << "compressing " << src.string() << " to " << dest.string();

    remove_existing(dest);

    try {
      archive_ptr a{::archive_write_new(), ::archive_write_free};

      check_result(a, ::archive_write_add_filter_gzip(a.get()));
      check_result(a, ::archive_write_set_format_raw(a.get()));
      check_result(a, ::archive_write_set_bytes_in_last_block(a.get(), 1));
      check_result(a, ::archive_write_open_filename(a.get(), dest.c_str()));

      entry_ptr ae{::archive_entry_new(), ::archive_entry_free};
      ::archive_entry_set_pathname(ae.get(), src.filename().c_str());
      ::archive_entry_set_filetype(ae.get(), AE_IFREG);
      ::archive_entry_set_perm(ae.get(), 0644);
      ::archive_entry_set_size(ae.get(), fs::file_size(src));

      check_result(a, ::archive_write_header(a.get(), ae.get()));
      write_file_data(a, src);
      check_result(a, ::archive_write_close(a.get()));
    } catch (...) {
      std::error_code ec;
      fs::remove(dest, ec);
      throw;
    }

    replace(artifact, dest);
  }

  void tar(local_artifact& artifact) {
    auto const src = artifact.path();
    auto const dest = fs::path(src.string() + ".tgz");

    auto ti = LOG_TIMED_VERBOSE;
    ti << "archiving " << src.string() << " to " << dest.string();

    remove_existing(dest);

    try {
      archive_ptr a{::archive_write_new(), ::archive_write_free};
      archive_ptr disk{::archive_read_disk_new(), ::archive_read_free};

      check_result(a, ::archive_write_add_filter_gzip(a.get()));
      check_result(a, ::archive_write_set_format_pax_restricted(a.get()));
      check_result(a, ::archive_write_set_bytes_in_last_block(a.get(), 1));
      check_result(a, ::archive_write_open_filename(a.get(), dest.c_str()));
      check_result(disk, ::archive_read_disk_set_standard_lookup(disk.get()));

      auto add = [&](fs::path const& path, fs::path const& rel) {
        entry_ptr ae{::archive_entry_new(), ::archive_entry_free};

        ::archive_entry_copy_sourcepath(ae.get(), path.c_str());
        check_result(disk, ::archive_read_disk_entry_from_file(
                               disk.get(), ae.get(), -1, nullptr));
        ::archive_entry_set_pathname(ae.get(), rel.generic_string().c_str());

        LOG_TRACE << "adding " << rel.generic_string();

        check_result(a, ::archive_write_header(a.get(), ae.get()));

        if (::archive_entry_filetype(ae.get()) == AE_IFREG &&
            ::archive_entry_size(ae.get()) > 0) {
          write_file_data(a, path);
        }
      };

      // the directory itself may be a symlink created by the file driver
      auto const root = fs::canonical(src);

      add(root, src.filename());

      for (auto const& e : fs::recursive_directory_iterator(root)) {
        add(e.path(), src.filename() / e.path().lexically_relative(root));
      }

      check_result(a, ::archive_write_close(a.get()));
    } catch (std::filesystem::filesystem_error const& e) {
      std::error_code ec;
      fs::remove(dest, ec);
      URIFETCH_THROW(archive_error, e.what());
    } catch (...) {
      std::error_code ec;
      fs::remove(dest, ec);
      throw;
    }

    replace(artifact, dest);
  }

  void write_file_data(archive_ptr const& a, fs::path const& path) {
    std::error_code ec;
    auto in = fa_.open_input(path, ec);

    if (ec) {
      URIFETCH_THROW(archive_error, fmt::format("cannot read {}: {}",
                                                path.string(), ec.message()));
    }

    std::vector<char> buf(kCopyBufferSize);
    auto& is = in->is();

    while (is) {
      is.read(buf.data(), buf.size());
      if (auto n = is.gcount(); n > 0) {
        auto wr = ::archive_write_data(a.get(), buf.data(), n);
        if (wr < 0) {
          check_result(a, static_cast<int>(wr));
        }
      }
    }

    in->close(ec);

    if (ec) {
      URIFETCH_THROW(archive_error, fmt::format("cannot read {}: {}",
                                                path.string(), ec.message()));
    }
  }

  // The original artifact is only removed once its replacement exists.
  void replace(local_artifact& artifact, fs::path const& result) {
    remove_existing(artifact.path());
    artifact.reset(result);
    LOG_DEBUG << "artifact is now " << result.string() << " ("
              << artifact_kind_name(artifact.kind()) << ")";
  }

  void remove_existing(fs::path const& path) {
    std::error_code ec;

    if (fs::exists(fs::symlink_status(path, ec))) {
      fs::remove_all(path, ec);
      if (ec) {
        URIFETCH_THROW(archive_error,
                       fmt::format("cannot remove {}: {}", path.string(),
                                   ec.message()));
      }
    }
  }

  void check_result(archive_ptr const& a, int res) {
    switch (res) {
    case ARCHIVE_OK:
    case ARCHIVE_EOF:
    default:
      break;
    case ARCHIVE_WARN:
      if (auto const* msg = ::archive_error_string(a.get())) {
        LOG_WARN << msg;
      }
      break;
    case ARCHIVE_RETRY:
    case ARCHIVE_FAILED:
    case ARCHIVE_FATAL: {
      auto const* msg = ::archive_error_string(a.get());
      URIFETCH_THROW(archive_error, msg ? msg : "unknown archive error");
    }
    }
  }

  LOG_PROXY_DECL(LoggerPolicy);
  file_access const& fa_;
};

} // namespace internal

archive_transform::archive_transform(logger& lgr, file_access const& fa)
    : impl_{make_unique_logging_object<impl, internal::archive_transform_,
                                       logger_policies>(lgr, fa)} {}

} // namespace urifetch
