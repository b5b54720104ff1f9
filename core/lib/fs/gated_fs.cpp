// pkgindex/fs/gated_fs.cpp - Gated filesystem implementation
#include "pkgindex/fs/gated_fs.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "pkgindex/basic/path_util.hpp"

namespace pkgindex::fs
{

// ============================================================================
// Gate
// ============================================================================

Gate::Gate(int limit, int default_limit) : limit_(limit == 0 ? default_limit : limit)
{
  if (limit_ > 0) {
    sem_ = std::make_unique<std::counting_semaphore<>>(limit_);
  }
}

void Gate::acquire()
{
  if (sem_) {
    sem_->acquire();
  }
}

void Gate::release()
{
  if (sem_) {
    sem_->release();
  }
}

GatePermit & GatePermit::operator=(GatePermit && other) noexcept
{
  if (this != &other) {
    if (gate_ != nullptr) {
      gate_->release();
    }
    gate_ = other.gate_;
    other.gate_ = nullptr;
  }
  return *this;
}

// ============================================================================
// GatedFile
// ============================================================================

GatedFile::GatedFile(std::FILE * file, std::string path, GatePermit permit)
: file_(file), path_(std::move(path)), permit_(std::move(permit))
{
}

GatedFile::GatedFile(GatedFile && other) noexcept
: file_(other.file_), path_(std::move(other.path_)), permit_(std::move(other.permit_))
{
  other.file_ = nullptr;
}

GatedFile::~GatedFile()
{
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

FsResult<std::string> GatedFile::read(size_t max_bytes)
{
  std::string buf(max_bytes, '\0');
  const size_t n = std::fread(buf.data(), 1, max_bytes, file_);
  if (n < max_bytes && std::ferror(file_) != 0) {
    const int err = errno;
    return FsError::from_errno(err, "read", path_);
  }
  buf.resize(n);
  return buf;
}

// ============================================================================
// GatedFs
// ============================================================================

GatedFs::GatedFs(int max_open_files, int max_open_dirs)
: files_(max_open_files, k_default_max_open_files), dirs_(max_open_dirs, k_default_max_open_dirs)
{
}

FsResult<FileStat> GatedFs::stat(const std::string & path) const
{
  struct stat st = {};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    return FsError::from_errno(err, "stat", path);
  }
  return FileStat::from_stat(std::string(path_base(path)), st);
}

FsResult<FileStat> GatedFs::lstat(const std::string & path) const
{
  struct stat st = {};
  if (::lstat(path.c_str(), &st) != 0) {
    const int err = errno;
    return FsError::from_errno(err, "lstat", path);
  }
  return FileStat::from_stat(std::string(path_base(path)), st);
}

namespace
{

/// Owns a DIR stream.
struct DirCloser
{
  void operator()(DIR * d) const noexcept { ::closedir(d); }
};
using DirPtr = std::unique_ptr<DIR, DirCloser>;

bool is_dot_entry(const char * name)
{
  return std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0;
}

}  // namespace

FsResult<std::vector<std::string>> GatedFs::readdirnames(const std::string & path)
{
  GatePermit permit(dirs_);

  DirPtr dir(::opendir(path.c_str()));
  if (!dir) {
    const int err = errno;
    return FsError::from_errno(err, "opendir", path);
  }

  std::vector<std::string> names;
  while (true) {
    errno = 0;
    const dirent * ent = ::readdir(dir.get());
    if (ent == nullptr) {
      if (errno != 0) {
        const int err = errno;
        return FsError::from_errno(err, "readdirent", path);
      }
      break;
    }
    if (!is_dot_entry(ent->d_name)) {
      names.emplace_back(ent->d_name);
    }
  }

  std::sort(names.begin(), names.end());
  return names;
}

FsResult<std::vector<FileStat>> GatedFs::readdir(const std::string & path)
{
  GatePermit permit(dirs_);

  DirPtr dir(::opendir(path.c_str()));
  if (!dir) {
    const int err = errno;
    return FsError::from_errno(err, "opendir", path);
  }
  const int fd = ::dirfd(dir.get());

  std::vector<FileStat> entries;
  while (true) {
    errno = 0;
    const dirent * ent = ::readdir(dir.get());
    if (ent == nullptr) {
      if (errno != 0) {
        const int err = errno;
        return FsError::from_errno(err, "readdirent", path);
      }
      break;
    }
    if (is_dot_entry(ent->d_name)) {
      continue;
    }
    struct stat st = {};
    if (::fstatat(fd, ent->d_name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
      // Removed since the listing was read.
      continue;
    }
    entries.push_back(FileStat::from_stat(ent->d_name, st));
  }

  std::sort(entries.begin(), entries.end(), [](const FileStat & a, const FileStat & b) {
    return a.name < b.name;
  });
  return entries;
}

FsResult<std::string> GatedFs::read_file(const std::string & path)
{
  auto file = open_file(path);
  if (!file) {
    return file.error();
  }

  std::string content;
  while (true) {
    auto chunk = file->read(64 * 1024);
    if (!chunk) {
      return chunk.error();
    }
    if (chunk->empty()) {
      break;
    }
    content.append(*chunk);
  }
  return content;
}

FsResult<GatedFile> GatedFs::open_file(const std::string & path)
{
  GatePermit permit(files_);

  std::FILE * f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) {
    const int err = errno;
    return FsError::from_errno(err, "open", path);
  }
  return GatedFile(f, path, std::move(permit));
}

}  // namespace pkgindex::fs
