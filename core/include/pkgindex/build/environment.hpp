// pkgindex/build/environment.hpp - Build environment capability
//
// The index never inspects GOROOT, GOPATH or build tags directly. Everything
// it needs to know about the workspace and target platform is obtained
// through this interface.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgindex::build
{

/**
 * Where the compiled form of a library package is installed, relative to
 * its workspace root.
 */
struct TargetPath
{
  std::string pkg_root;  ///< e.g. "pkg/linux_amd64"
  std::string archive;   ///< e.g. "pkg/linux_amd64/net/http.a"
};

class Environment
{
public:
  virtual ~Environment() = default;

  /// Absolute source roots in search order. Do not cache across updates.
  [[nodiscard]] virtual std::vector<std::string> source_roots() const = 0;

  /// Source root of the standard library ("$GOROOT/src").
  [[nodiscard]] virtual std::string standard_tree_root() const = 0;

  [[nodiscard]] virtual std::string goos() const = 0;
  [[nodiscard]] virtual std::string goarch() const = 0;
  [[nodiscard]] virtual std::vector<std::string> build_tags() const = 0;
  [[nodiscard]] virtual bool cgo_enabled() const = 0;

  /**
   * Report whether file name in directory dir takes part in a build for the
   * current platform and tag set. May read the file.
   */
  [[nodiscard]] virtual bool match_file(const std::string & dir, const std::string & name) const = 0;

  /// Install location for the library at import_path, if the toolchain is known.
  [[nodiscard]] virtual std::optional<TargetPath> target_path(std::string_view import_path) const = 0;

  /**
   * A counter that increases whenever a value affecting source_roots() or
   * match_file() changes. Starts at 1; 0 means "never classified".
   */
  [[nodiscard]] virtual uint64_t revision() const = 0;
};

}  // namespace pkgindex::build
