// pkgindex/test_support/fake_environment.hpp - Scriptable build environment
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pkgindex/basic/path_util.hpp"
#include "pkgindex/build/environment.hpp"

namespace pkgindex::test_support
{

/**
 * An Environment whose roots and file matching are set by the test.
 *
 * Every file matches unless its name was passed to reject(). Changing
 * either bumps revision().
 */
class FakeEnvironment final : public build::Environment
{
public:
  explicit FakeEnvironment(std::vector<std::string> roots, std::string standard_root = {})
  : roots_(std::move(roots)), standard_root_(std::move(standard_root))
  {
  }

  [[nodiscard]] std::vector<std::string> source_roots() const override
  {
    std::lock_guard lock(mu_);
    return roots_;
  }

  [[nodiscard]] std::string standard_tree_root() const override { return standard_root_; }
  [[nodiscard]] std::string goos() const override { return "linux"; }
  [[nodiscard]] std::string goarch() const override { return "amd64"; }

  [[nodiscard]] std::vector<std::string> build_tags() const override
  {
    std::lock_guard lock(mu_);
    return {rejected_.begin(), rejected_.end()};
  }

  [[nodiscard]] bool cgo_enabled() const override { return false; }

  [[nodiscard]] bool match_file(const std::string &, const std::string & name) const override
  {
    match_calls_.fetch_add(1);
    std::lock_guard lock(mu_);
    return rejected_.find(name) == rejected_.end();
  }

  [[nodiscard]] std::optional<build::TargetPath> target_path(
    std::string_view import_path) const override
  {
    build::TargetPath tp;
    tp.pkg_root = "pkg/linux_amd64";
    tp.archive = path_join(tp.pkg_root, std::string(import_path) + ".a");
    return tp;
  }

  [[nodiscard]] uint64_t revision() const override { return revision_.load(); }

  void reject(const std::string & name)
  {
    std::lock_guard lock(mu_);
    if (rejected_.insert(name).second) {
      revision_.fetch_add(1);
    }
  }

  void accept(const std::string & name)
  {
    std::lock_guard lock(mu_);
    if (rejected_.erase(name) != 0) {
      revision_.fetch_add(1);
    }
  }

  void set_source_roots(std::vector<std::string> roots)
  {
    std::lock_guard lock(mu_);
    roots_ = std::move(roots);
    revision_.fetch_add(1);
  }

  [[nodiscard]] int match_calls() const noexcept { return match_calls_.load(); }

private:
  mutable std::mutex mu_;
  std::vector<std::string> roots_;
  std::string standard_root_;
  std::set<std::string> rejected_;
  std::atomic<uint64_t> revision_{1};
  mutable std::atomic<int> match_calls_{0};
};

}  // namespace pkgindex::test_support
