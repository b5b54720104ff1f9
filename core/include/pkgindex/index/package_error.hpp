// pkgindex/index/package_error.hpp - Structural package errors
#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace pkgindex
{

enum class PackageErrorKind : uint8_t {
  None,
  NoGoFiles,           ///< Directory yields no package at all
  NoBuildableSources,  ///< Only ignored or test files
  MultiplePackages,    ///< Buildable files disagree on the package name
};

/**
 * Why a directory does not form a clean package.
 *
 * NoBuildableSources and MultiplePackages are attached to the Package and
 * kept while the condition lasts. NoGoFiles is only ever returned.
 */
struct PackageError
{
  PackageErrorKind kind = PackageErrorKind::None;
  std::string dir;
  std::array<std::string, 2> names;  ///< MultiplePackages only
  std::array<std::string, 2> files;  ///< MultiplePackages only

  [[nodiscard]] static PackageError no_go_files(std::string dir);
  [[nodiscard]] static PackageError no_buildable_sources(std::string dir);
  [[nodiscard]] static PackageError multiple_packages(
    std::string dir, std::array<std::string, 2> names, std::array<std::string, 2> files);

  [[nodiscard]] bool ok() const noexcept { return kind == PackageErrorKind::None; }

  /// Human readable message; empty when ok().
  [[nodiscard]] std::string message() const;

  bool operator==(const PackageError & other) const = default;
};

}  // namespace pkgindex
