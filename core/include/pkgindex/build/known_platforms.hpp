// pkgindex/build/known_platforms.hpp - Known GOOS and GOARCH values
#pragma once

#include <array>
#include <string_view>

namespace pkgindex::build
{

inline constexpr std::array<std::string_view, 18> k_known_os = {
  "aix",     "android", "darwin", "dragonfly", "freebsd", "hurd",
  "illumos", "ios",     "js",     "linux",     "nacl",    "netbsd",
  "openbsd", "plan9",   "solaris", "wasip1",   "windows", "zos",
};

/// GOOS values that satisfy the "unix" build tag.
inline constexpr std::array<std::string_view, 12> k_unix_os = {
  "aix",     "android", "darwin", "dragonfly", "freebsd", "hurd",
  "illumos", "ios",     "linux",  "netbsd",    "openbsd", "solaris",
};

inline constexpr std::array<std::string_view, 24> k_known_arch = {
  "386",      "amd64",    "amd64p32",  "arm",         "armbe",   "arm64",
  "arm64be",  "loong64",  "mips",      "mipsle",      "mips64",  "mips64le",
  "mips64p32", "mips64p32le", "ppc",   "ppc64",       "ppc64le", "riscv",
  "riscv64",  "s390",     "s390x",     "sparc",       "sparc64", "wasm",
};

/// Minor version of the newest Go release whose go1.N tag is satisfied.
inline constexpr int k_go_release_minor = 22;

[[nodiscard]] bool is_known_os(std::string_view s) noexcept;
[[nodiscard]] bool is_known_arch(std::string_view s) noexcept;
[[nodiscard]] bool is_unix_os(std::string_view s) noexcept;

/// GOOS of the host this library was built for.
[[nodiscard]] std::string_view host_os() noexcept;

/// GOARCH of the host this library was built for.
[[nodiscard]] std::string_view host_arch() noexcept;

}  // namespace pkgindex::build
