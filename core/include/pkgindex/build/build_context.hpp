// pkgindex/build/build_context.hpp - Environment backed by GOROOT/GOPATH
//
// BuildContext answers Environment queries from explicit options, falling
// back to the process environment (GOROOT, GOPATH, GOOS, GOARCH,
// CGO_ENABLED) and then to host defaults. Sampled values are re-read when
// the update interval has elapsed, so changes to the environment are picked
// up without restarting.
//
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgindex/build/environment.hpp"
#include "pkgindex/fs/gated_fs.hpp"

namespace pkgindex::build
{

// ============================================================================
// Options
// ============================================================================

/**
 * Explicit environment settings. Empty fields are sampled.
 */
struct EnvironmentOptions
{
  std::string goroot;
  std::vector<std::string> gopath;
  std::string goos;
  std::string goarch;
  std::vector<std::string> build_tags;
  std::optional<bool> cgo_enabled;

  /// "gc" or "gccgo"
  std::string compiler = "gc";

  /// Suffix for the install directory ("race" selects pkg/linux_amd64_race)
  std::string install_suffix;
};

// ============================================================================
// BuildContext
// ============================================================================

class BuildContext final : public Environment
{
public:
  /**
   * @param options          Explicit settings; empty fields are sampled
   * @param update_interval  Minimum time between re-samples; zero or negative
   *                         samples only once
   * @param logger           Logger; defaults to the shared "pkgindex" logger
   */
  explicit BuildContext(
    EnvironmentOptions options = {},
    std::chrono::milliseconds update_interval = std::chrono::milliseconds::zero(),
    std::shared_ptr<spdlog::logger> logger = nullptr);

  // Environment
  [[nodiscard]] std::vector<std::string> source_roots() const override;
  [[nodiscard]] std::string standard_tree_root() const override;
  [[nodiscard]] std::string goos() const override;
  [[nodiscard]] std::string goarch() const override;
  [[nodiscard]] std::vector<std::string> build_tags() const override;
  [[nodiscard]] bool cgo_enabled() const override;
  [[nodiscard]] bool match_file(const std::string & dir, const std::string & name) const override;
  [[nodiscard]] std::optional<TargetPath> target_path(std::string_view import_path) const override;
  [[nodiscard]] uint64_t revision() const override { return revision_.load(); }

  [[nodiscard]] std::string goroot() const;
  [[nodiscard]] std::vector<std::string> gopath() const;
  [[nodiscard]] std::string compiler() const;

  /// Whether a single build tag is satisfied by the current settings.
  [[nodiscard]] bool match_tag(std::string_view tag) const;

  // Setters pin a value and bump revision() when it changes.
  void set_goroot(std::string goroot);
  void set_gopath(std::vector<std::string> gopath);
  void set_platform(std::string goos, std::string goarch);
  void set_build_tags(std::vector<std::string> tags);
  void set_cgo_enabled(bool enabled);

  /// Re-sample the process environment now.
  void refresh();

private:
  struct State
  {
    std::string goroot;
    std::vector<std::string> gopath;
    std::string goos;
    std::string goarch;
    std::vector<std::string> build_tags;
    bool cgo_enabled = true;
    std::string compiler;
    std::string install_suffix;
    std::vector<std::string> source_roots;

    bool operator==(const State &) const = default;
  };

  [[nodiscard]] State sample() const;
  [[nodiscard]] std::vector<std::string> compute_source_roots(const State & s) const;
  [[nodiscard]] static bool tag_satisfied(const State & s, std::string_view tag);

  void refresh_if_outdated() const;
  void apply(State next) const;

  EnvironmentOptions pinned_;
  std::chrono::milliseconds update_interval_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mu_;
  mutable State state_;
  mutable std::chrono::steady_clock::time_point last_update_;
  mutable std::atomic<uint64_t> revision_{0};
  mutable fs::GatedFs fs_;
};

}  // namespace pkgindex::build
