// pkgindex/fs/fs_error.hpp - Filesystem errors and results
#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace pkgindex::fs
{

/**
 * An I/O failure: the operation, the path it was applied to and the
 * underlying system error.
 */
struct FsError
{
  std::string op;  ///< "stat", "lstat", "open", "opendir", "read", ...
  std::string path;
  std::error_code code;

  /// "<op> <path>: <strerror>"
  [[nodiscard]] std::string message() const;

  /// Whether the failure arose while resolving the path itself.
  [[nodiscard]] bool is_path_error() const noexcept;

  /// Whether the path does not exist (ENOENT or ENOTDIR).
  [[nodiscard]] bool is_not_exist() const noexcept;

  /// Wrap an errno value captured after op failed on path.
  [[nodiscard]] static FsError from_errno(int err, std::string op, std::string path);
};

/**
 * Either a value or an FsError. Filesystem operations never throw.
 */
template <typename T>
class FsResult
{
public:
  FsResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  FsResult(FsError error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  [[nodiscard]] T && value() && { return std::get<0>(std::move(data_)); }

  [[nodiscard]] T & operator*() & { return value(); }
  [[nodiscard]] const T & operator*() const & { return value(); }
  [[nodiscard]] T * operator->() { return &value(); }
  [[nodiscard]] const T * operator->() const { return &value(); }

  [[nodiscard]] const FsError & error() const { return std::get<1>(data_); }

private:
  std::variant<T, FsError> data_;
};

}  // namespace pkgindex::fs
