// pkgindex/index/corpus.hpp - Incrementally updated package index
//
// A Corpus owns everything one index needs: the filesystem gates, string
// pool, package registry, identifier tables and the directory trees of
// every source root. Independent Corpus objects share nothing.
//
#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "pkgindex/basic/string_interner.hpp"
#include "pkgindex/build/environment.hpp"
#include "pkgindex/fs/gated_fs.hpp"
#include "pkgindex/index/directory.hpp"
#include "pkgindex/index/event.hpp"
#include "pkgindex/index/ident_index.hpp"
#include "pkgindex/index/package_registry.hpp"

namespace pkgindex
{

struct CorpusOptions
{
  int max_open_files = 0;  ///< 0 selects the default, < 0 disables the gate
  int max_open_dirs = 0;   ///< Same convention as max_open_files
  int max_depth = 0;       ///< <= 0 means unlimited
  bool index_identifiers = false;
  bool log_events = false;

  /// Re-sample interval of the default environment.
  std::chrono::milliseconds update_interval{0};
};

class Corpus
{
public:
  /**
   * @param env     Build environment; null constructs a BuildContext from
   *                the process environment
   * @param options Index options
   * @param logger  Logger; defaults to the shared "pkgindex" logger
   */
  explicit Corpus(
    std::shared_ptr<const build::Environment> env = nullptr, CorpusOptions options = {},
    std::shared_ptr<spdlog::logger> logger = nullptr);

  Corpus(const Corpus &) = delete;
  Corpus & operator=(const Corpus &) = delete;

  /**
   * Initial sweep. Packages discovered here do not produce notifications.
   *
   * @return std::nullopt on success, otherwise why the sweep could not start
   */
  std::optional<std::string> init();

  /// Bring every source root up to date with the disk.
  std::optional<std::string> update();

  /// Package directories importable from reference, sorted.
  [[nodiscard]] std::vector<std::string> list_imports(std::string_view reference) const;

  [[nodiscard]] std::optional<Directory> lookup(std::string_view path) const;
  [[nodiscard]] PackagePtr lookup_package(std::string_view dir) const;
  [[nodiscard]] PackagePtr lookup_by_name(std::string_view name) const;
  [[nodiscard]] std::vector<PackagePtr> packages() const;

  /// Root directories, in source root order.
  [[nodiscard]] std::vector<Directory> dirs() const;

  [[nodiscard]] const IdentIndex & idents() const noexcept { return idents_; }
  [[nodiscard]] std::vector<Ident> lookup_idents(TypKind kind, std::string_view name) const;
  [[nodiscard]] std::vector<Ident> exports(std::string_view dir) const;

  /// Notifications emitted since the last call.
  [[nodiscard]] std::vector<Event> drain_events();
  void set_event_handler(EventHandler handler);

  /// Reclassify every file on the next update.
  void invalidate_environment();

  [[nodiscard]] const PackageRegistry & registry() const noexcept { return registry_; }
  [[nodiscard]] const build::Environment & environment() const noexcept { return *env_; }
  [[nodiscard]] const CorpusOptions & options() const noexcept { return options_; }
  [[nodiscard]] bool initialized() const noexcept { return initialized_; }

private:
  std::optional<std::string> update_locked();

  CorpusOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<const build::Environment> env_;

  fs::GatedFs fs_;
  StringInterner strings_;
  PackageRegistry registry_;
  IdentIndex idents_;
  EventSink events_;

  std::mutex update_mu_;  ///< Serializes init() and update()
  std::atomic<bool> initialized_{false};

  mutable std::shared_mutex tree_mu_;
  std::vector<Directory> dirs_;  ///< One per source root
};

}  // namespace pkgindex
