// pkgindex/build/build_context.cpp - GOROOT/GOPATH environment
#include "pkgindex/build/build_context.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>

#include "pkgindex/basic/logging.hpp"
#include "pkgindex/basic/path_util.hpp"
#include "pkgindex/build/build_constraint.hpp"
#include "pkgindex/build/known_platforms.hpp"
#include "pkgindex/syntax/parser.hpp"

namespace pkgindex::build
{
namespace
{

std::string getenv_string(const char * name)
{
  const char * v = std::getenv(name);
  return v != nullptr ? std::string(v) : std::string();
}

std::vector<std::string> split_list(std::string_view s)
{
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= s.size()) {
    auto next = s.find(':', pos);
    if (next == std::string_view::npos) {
      next = s.size();
    }
    if (next > pos) {
      out.emplace_back(s.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return out;
}

std::string join_list(const std::vector<std::string> & list)
{
  std::string out;
  for (const auto & s : list) {
    if (!out.empty()) {
      out.push_back(':');
    }
    out += s;
  }
  return out;
}

bool is_release_tag(std::string_view tag)
{
  constexpr std::string_view k_prefix = "go1.";
  if (tag.size() <= k_prefix.size() || tag.substr(0, k_prefix.size()) != k_prefix) {
    return false;
  }
  int minor = 0;
  for (const char c : tag.substr(k_prefix.size())) {
    if (c < '0' || c > '9') {
      return false;
    }
    minor = minor * 10 + (c - '0');
    if (minor > k_go_release_minor) {
      return false;
    }
  }
  return minor >= 1;
}

}  // namespace

BuildContext::BuildContext(
  EnvironmentOptions options, std::chrono::milliseconds update_interval,
  std::shared_ptr<spdlog::logger> logger)
: pinned_(std::move(options)),
  update_interval_(update_interval),
  logger_(logger ? std::move(logger) : make_logger())
{
  std::unique_lock lock(mu_);
  state_ = sample();
  last_update_ = std::chrono::steady_clock::now();
  revision_.store(1);
}

// ============================================================================
// Sampling
// ============================================================================

BuildContext::State BuildContext::sample() const
{
  State s;

  s.goroot = pinned_.goroot;
  if (s.goroot.empty()) {
    s.goroot = getenv_string("GOROOT");
  }
  if (s.goroot.empty()) {
    for (const char * candidate : {"/usr/local/go", "/usr/lib/go"}) {
      auto st = fs_.stat(candidate);
      if (st && st->is_dir) {
        s.goroot = candidate;
        break;
      }
    }
  }
  if (!s.goroot.empty()) {
    s.goroot = clean_path(s.goroot);
  }

  s.gopath = pinned_.gopath;
  if (s.gopath.empty()) {
    s.gopath = split_list(getenv_string("GOPATH"));
  }
  if (s.gopath.empty()) {
    if (const auto home = getenv_string("HOME"); !home.empty()) {
      s.gopath.push_back(path_join(home, "go"));
    }
  }
  for (auto & p : s.gopath) {
    p = clean_path(p);
  }

  s.goos = pinned_.goos;
  if (s.goos.empty()) {
    s.goos = getenv_string("GOOS");
  }
  if (s.goos.empty()) {
    s.goos = std::string(host_os());
  }

  s.goarch = pinned_.goarch;
  if (s.goarch.empty()) {
    s.goarch = getenv_string("GOARCH");
  }
  if (s.goarch.empty()) {
    s.goarch = std::string(host_arch());
  }

  s.build_tags = pinned_.build_tags;

  if (pinned_.cgo_enabled) {
    s.cgo_enabled = *pinned_.cgo_enabled;
  } else {
    const auto cgo = getenv_string("CGO_ENABLED");
    s.cgo_enabled = cgo.empty() ? s.goos == host_os() && s.goarch == host_arch() : cgo == "1";
  }

  s.compiler = pinned_.compiler.empty() ? std::string("gc") : pinned_.compiler;
  s.install_suffix = pinned_.install_suffix;
  s.source_roots = compute_source_roots(s);
  return s;
}

std::vector<std::string> BuildContext::compute_source_roots(const State & s) const
{
  std::vector<std::string> roots;
  auto add_if_dir = [&](const std::string & root) {
    auto st = fs_.stat(root);
    if (st && st->is_dir && std::find(roots.begin(), roots.end(), root) == roots.end()) {
      roots.push_back(root);
    }
  };

  if (!s.goroot.empty()) {
    add_if_dir(path_join(s.goroot, "src"));
  }
  for (const auto & p : s.gopath) {
    if (p.empty() || p == s.goroot) {
      continue;
    }
    add_if_dir(path_join(p, "src"));
  }
  return roots;
}

void BuildContext::apply(State next) const
{
  last_update_ = std::chrono::steady_clock::now();
  if (next == state_) {
    return;
  }
  logger_->info(
    "environment changed: GOROOT={} GOPATH={} GOOS={} GOARCH={} tags=[{}]", next.goroot,
    join_list(next.gopath), next.goos, next.goarch, join_list(next.build_tags));
  state_ = std::move(next);
  revision_.fetch_add(1);
}

void BuildContext::refresh_if_outdated() const
{
  if (update_interval_ <= std::chrono::milliseconds::zero()) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  {
    std::shared_lock lock(mu_);
    if (now - last_update_ < update_interval_) {
      return;
    }
  }
  std::unique_lock lock(mu_);
  if (now - last_update_ < update_interval_) {
    return;
  }
  apply(sample());
}

void BuildContext::refresh()
{
  std::unique_lock lock(mu_);
  apply(sample());
}

// ============================================================================
// Environment
// ============================================================================

std::vector<std::string> BuildContext::source_roots() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.source_roots;
}

std::string BuildContext::standard_tree_root() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.goroot.empty() ? std::string() : path_join(state_.goroot, "src");
}

std::string BuildContext::goos() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.goos;
}

std::string BuildContext::goarch() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.goarch;
}

std::vector<std::string> BuildContext::build_tags() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.build_tags;
}

bool BuildContext::cgo_enabled() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.cgo_enabled;
}

std::string BuildContext::goroot() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.goroot;
}

std::vector<std::string> BuildContext::gopath() const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return state_.gopath;
}

std::string BuildContext::compiler() const
{
  std::shared_lock lock(mu_);
  return state_.compiler;
}

bool BuildContext::tag_satisfied(const State & s, std::string_view tag)
{
  if (tag.empty()) {
    return false;
  }
  if (tag == s.goos || tag == s.goarch || tag == s.compiler) {
    return true;
  }
  if (tag == "cgo" && s.cgo_enabled) {
    return true;
  }
  if (
    (s.goos == "android" && tag == "linux") || (s.goos == "illumos" && tag == "solaris") ||
    (s.goos == "ios" && tag == "darwin")) {
    return true;
  }
  if (tag == "unix" && is_unix_os(s.goos)) {
    return true;
  }
  if (std::find(s.build_tags.begin(), s.build_tags.end(), tag) != s.build_tags.end()) {
    return true;
  }
  return is_release_tag(tag);
}

bool BuildContext::match_tag(std::string_view tag) const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);
  return tag_satisfied(state_, tag);
}

bool BuildContext::match_file(const std::string & dir, const std::string & name) const
{
  if (!is_valid_name(name)) {
    return false;
  }
  const auto ext = path_ext(name);
  if (!is_buildable_extension(ext)) {
    return false;
  }

  refresh_if_outdated();
  State s;
  {
    std::shared_lock lock(mu_);
    s = state_;
  }

  if (!good_os_arch_file(name, s.goos, s.goarch)) {
    return false;
  }
  if (ext == ".syso") {
    return true;
  }

  auto content = fs_.read_file(path_join(dir, name));
  if (!content) {
    logger_->trace("match_file: {}", content.error().message());
    return false;
  }

  const TagPredicate has_tag = [&s](std::string_view tag) { return tag_satisfied(s, tag); };
  if (!should_build(*content, has_tag)) {
    return false;
  }
  if (ext == ".go" && !s.cgo_enabled && syntax::imports_cgo(*content)) {
    return false;
  }
  return true;
}

std::optional<TargetPath> BuildContext::target_path(std::string_view import_path) const
{
  refresh_if_outdated();
  std::shared_lock lock(mu_);

  std::string suffix;
  if (!state_.install_suffix.empty()) {
    suffix = "_" + state_.install_suffix;
  }

  TargetPath out;
  if (state_.compiler == "gccgo") {
    out.pkg_root = "pkg/gccgo_" + state_.goos + "_" + state_.goarch + suffix;
    const auto slash = import_path.rfind('/');
    const auto dir = slash == std::string_view::npos ? std::string_view() : import_path.substr(0, slash + 1);
    const auto elem = slash == std::string_view::npos ? import_path : import_path.substr(slash + 1);
    out.archive = out.pkg_root + "/" + std::string(dir) + "lib" + std::string(elem) + ".a";
    return out;
  }
  if (state_.compiler == "gc") {
    out.pkg_root = "pkg/" + state_.goos + "_" + state_.goarch + suffix;
    out.archive = out.pkg_root + "/" + std::string(import_path) + ".a";
    return out;
  }

  logger_->warn("unknown compiler \"{}\"", state_.compiler);
  return std::nullopt;
}

// ============================================================================
// Setters
// ============================================================================

void BuildContext::set_goroot(std::string goroot)
{
  std::unique_lock lock(mu_);
  pinned_.goroot = std::move(goroot);
  apply(sample());
}

void BuildContext::set_gopath(std::vector<std::string> gopath)
{
  std::unique_lock lock(mu_);
  pinned_.gopath = std::move(gopath);
  apply(sample());
}

void BuildContext::set_platform(std::string goos, std::string goarch)
{
  std::unique_lock lock(mu_);
  pinned_.goos = std::move(goos);
  pinned_.goarch = std::move(goarch);
  apply(sample());
}

void BuildContext::set_build_tags(std::vector<std::string> tags)
{
  std::unique_lock lock(mu_);
  pinned_.build_tags = std::move(tags);
  apply(sample());
}

void BuildContext::set_cgo_enabled(bool enabled)
{
  std::unique_lock lock(mu_);
  pinned_.cgo_enabled = enabled;
  apply(sample());
}

}  // namespace pkgindex::build
