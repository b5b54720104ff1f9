// pkgindex/test_support/temp_dir.hpp - Scratch directory trees for tests
//
// Change detection compares mtimes, and two writes inside one filesystem
// timestamp tick are indistinguishable. Every mutation made through TempDir
// therefore stamps the touched file and its parent with a strictly
// increasing time.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace pkgindex::test_support
{

struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::string_view prefix = "pkgindex_test")
  {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           (std::string(prefix) + "_" + std::to_string(stamp) + "_" +
            std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path);
    path = std::filesystem::canonical(path);
    clock_ = std::filesystem::file_time_type::clock::now();
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Absolute path of rel as a string.
  [[nodiscard]] std::string str(std::string_view rel = {}) const
  {
    if (rel.empty()) {
      return path.string();
    }
    return (path / rel).string();
  }

  /// Create directory rel and any missing parents.
  void make_dir(std::string_view rel)
  {
    const auto p = path / rel;
    std::filesystem::create_directories(p);
    stamp(p);
    stamp(p.parent_path());
  }

  /// Write content to file rel, creating parent directories.
  void write_file(std::string_view rel, std::string_view content)
  {
    const auto p = path / rel;
    if (!std::filesystem::exists(p.parent_path())) {
      make_dir(p.parent_path().lexically_relative(path).string());
    }
    {
      std::ofstream out(p, std::ios::binary | std::ios::trunc);
      out << content;
    }
    stamp(p);
    stamp(p.parent_path());
  }

  /// Remove file or directory tree rel.
  void remove(std::string_view rel)
  {
    const auto p = path / rel;
    std::filesystem::remove_all(p);
    stamp(p.parent_path());
  }

  /// Give rel a fresh mtime without changing its content.
  void touch(std::string_view rel) { stamp(path / rel); }

private:
  void stamp(const std::filesystem::path & p)
  {
    clock_ += std::chrono::seconds(1);
    std::error_code ec;
    std::filesystem::last_write_time(p, clock_, ec);
  }

  std::filesystem::file_time_type clock_;
};

}  // namespace pkgindex::test_support
