// pkgindex/fs/fs_error.cpp - Filesystem error helpers
#include "pkgindex/fs/fs_error.hpp"

#include <fmt/format.h>

namespace pkgindex::fs
{

std::string FsError::message() const { return fmt::format("{} {}: {}", op, path, code.message()); }

bool FsError::is_path_error() const noexcept
{
  return op == "stat" || op == "lstat" || op == "open" || op == "opendir";
}

bool FsError::is_not_exist() const noexcept
{
  return code == std::errc::no_such_file_or_directory || code == std::errc::not_a_directory;
}

FsError FsError::from_errno(int err, std::string op, std::string path)
{
  return FsError{std::move(op), std::move(path), std::error_code(err, std::generic_category())};
}

}  // namespace pkgindex::fs
