// pkgindex/fs/gated_fs.hpp - Filesystem access with bounded concurrency
//
// A directory walk spawns one task per directory. Without a bound, a large
// tree would exhaust file descriptors; GatedFs caps the number of files and
// directories open at once and makes excess callers wait.
//
#pragma once

#include <cstddef>
#include <cstdio>
#include <memory>
#include <semaphore>
#include <string>
#include <vector>

#include "pkgindex/fs/file_stat.hpp"
#include "pkgindex/fs/fs_error.hpp"

namespace pkgindex::fs
{

inline constexpr int k_default_max_open_files = 200;
inline constexpr int k_default_max_open_dirs = 50;

/**
 * A counting gate. A null gate (limit < 0) never blocks.
 */
class Gate
{
public:
  /// limit == 0 selects default_limit; limit < 0 disables the gate.
  Gate(int limit, int default_limit);

  void acquire();
  void release();

  [[nodiscard]] bool enabled() const noexcept { return sem_ != nullptr; }
  [[nodiscard]] int limit() const noexcept { return limit_; }

private:
  int limit_;
  std::unique_ptr<std::counting_semaphore<>> sem_;
};

/// Holds one permit of a Gate for its lifetime.
class GatePermit
{
public:
  explicit GatePermit(Gate & gate) : gate_(&gate) { gate_->acquire(); }
  ~GatePermit()
  {
    if (gate_ != nullptr) {
      gate_->release();
    }
  }

  GatePermit(const GatePermit &) = delete;
  GatePermit & operator=(const GatePermit &) = delete;
  GatePermit(GatePermit && other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
  GatePermit & operator=(GatePermit && other) noexcept;

private:
  Gate * gate_;
};

/**
 * An open file that holds a file permit until closed or destroyed.
 */
class GatedFile
{
public:
  GatedFile(std::FILE * file, std::string path, GatePermit permit);
  ~GatedFile();

  GatedFile(const GatedFile &) = delete;
  GatedFile & operator=(const GatedFile &) = delete;
  GatedFile(GatedFile && other) noexcept;
  GatedFile & operator=(GatedFile && other) = delete;

  /// Read up to max_bytes; an empty string means end of file.
  [[nodiscard]] FsResult<std::string> read(size_t max_bytes);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  std::FILE * file_;
  std::string path_;
  GatePermit permit_;
};

/**
 * Gated access to the local filesystem.
 *
 * Readdir and Readdirnames hold a directory permit; ReadFile and OpenFile hold
 * a file permit. Stat and Lstat are ungated. All operations are thread-safe.
 */
class GatedFs
{
public:
  /// Limits follow the Gate convention: 0 selects the default, < 0 disables.
  explicit GatedFs(int max_open_files = 0, int max_open_dirs = 0);

  GatedFs(const GatedFs &) = delete;
  GatedFs & operator=(const GatedFs &) = delete;

  [[nodiscard]] FsResult<FileStat> stat(const std::string & path) const;
  [[nodiscard]] FsResult<FileStat> lstat(const std::string & path) const;

  /// Entry names of a directory, sorted, excluding "." and "..".
  [[nodiscard]] FsResult<std::vector<std::string>> readdirnames(const std::string & path);

  /**
   * Lstat of every entry of a directory, sorted by name. Entries that vanish
   * between listing and lstat are omitted.
   */
  [[nodiscard]] FsResult<std::vector<FileStat>> readdir(const std::string & path);

  [[nodiscard]] FsResult<std::string> read_file(const std::string & path);

  [[nodiscard]] FsResult<GatedFile> open_file(const std::string & path);

  [[nodiscard]] int max_open_files() const noexcept { return files_.limit(); }
  [[nodiscard]] int max_open_dirs() const noexcept { return dirs_.limit(); }

private:
  Gate files_;
  Gate dirs_;
};

}  // namespace pkgindex::fs
