// pkgindex/index/package_error.cpp - Structural package errors
#include "pkgindex/index/package_error.hpp"

#include <utility>

#include <fmt/format.h>

namespace pkgindex
{

PackageError PackageError::no_go_files(std::string dir)
{
  PackageError err;
  err.kind = PackageErrorKind::NoGoFiles;
  err.dir = std::move(dir);
  return err;
}

PackageError PackageError::no_buildable_sources(std::string dir)
{
  PackageError err;
  err.kind = PackageErrorKind::NoBuildableSources;
  err.dir = std::move(dir);
  return err;
}

PackageError PackageError::multiple_packages(
  std::string dir, std::array<std::string, 2> names, std::array<std::string, 2> files)
{
  PackageError err;
  err.kind = PackageErrorKind::MultiplePackages;
  err.dir = std::move(dir);
  err.names = std::move(names);
  err.files = std::move(files);
  return err;
}

std::string PackageError::message() const
{
  switch (kind) {
    case PackageErrorKind::None:
      return {};
    case PackageErrorKind::NoGoFiles:
    case PackageErrorKind::NoBuildableSources:
      return fmt::format("no buildable Go source files in {}", dir);
    case PackageErrorKind::MultiplePackages:
      return fmt::format(
        "found packages {} ({}) and {} ({}) in {}", names[0], files[0], names[1], files[1], dir);
  }
  return {};
}

}  // namespace pkgindex
