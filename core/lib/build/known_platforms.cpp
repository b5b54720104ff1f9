#include "pkgindex/build/known_platforms.hpp"

#include <algorithm>

namespace pkgindex::build
{
namespace
{

template <size_t N>
bool contains(const std::array<std::string_view, N> & list, std::string_view s) noexcept
{
  return std::find(list.begin(), list.end(), s) != list.end();
}

}  // namespace

bool is_known_os(std::string_view s) noexcept { return contains(k_known_os, s); }

bool is_known_arch(std::string_view s) noexcept { return contains(k_known_arch, s); }

bool is_unix_os(std::string_view s) noexcept { return contains(k_unix_os, s); }

std::string_view host_os() noexcept
{
#if defined(__ANDROID__)
  return "android";
#elif defined(__linux__)
  return "linux";
#elif defined(__APPLE__)
  return "darwin";
#elif defined(__FreeBSD__)
  return "freebsd";
#elif defined(__NetBSD__)
  return "netbsd";
#elif defined(__OpenBSD__)
  return "openbsd";
#elif defined(__DragonFly__)
  return "dragonfly";
#elif defined(_WIN32)
  return "windows";
#elif defined(__sun)
  return "solaris";
#else
  return "linux";
#endif
}

std::string_view host_arch() noexcept
{
#if defined(__x86_64__) || defined(_M_X64)
  return "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
  return "386";
#elif defined(__arm__)
  return "arm";
#elif defined(__riscv) && __riscv_xlen == 64
  return "riscv64";
#elif defined(__powerpc64__) && defined(__LITTLE_ENDIAN__)
  return "ppc64le";
#elif defined(__powerpc64__)
  return "ppc64";
#elif defined(__s390x__)
  return "s390x";
#elif defined(__loongarch64)
  return "loong64";
#else
  return "amd64";
#endif
}

}  // namespace pkgindex::build
