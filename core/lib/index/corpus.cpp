// pkgindex/index/corpus.cpp - Incrementally updated package index
#include "pkgindex/index/corpus.hpp"

#include <algorithm>
#include <utility>

#include "pkgindex/basic/logging.hpp"
#include "pkgindex/basic/path_util.hpp"
#include "pkgindex/build/build_context.hpp"
#include "pkgindex/index/package_indexer.hpp"
#include "pkgindex/index/tree_builder.hpp"

namespace pkgindex
{

namespace
{

const Directory * find_root(const std::vector<Directory> & dirs, std::string_view root)
{
  for (const auto & d : dirs) {
    if (d.path == root) {
      return &d;
    }
  }
  return nullptr;
}

std::shared_ptr<const build::Environment> default_environment(
  std::chrono::milliseconds update_interval, std::shared_ptr<spdlog::logger> logger)
{
  return std::make_shared<build::BuildContext>(
    build::EnvironmentOptions{}, update_interval, std::move(logger));
}

}  // namespace

Corpus::Corpus(
  std::shared_ptr<const build::Environment> env, CorpusOptions options,
  std::shared_ptr<spdlog::logger> logger)
: options_(options),
  logger_(logger ? std::move(logger) : make_logger()),
  env_(env ? std::move(env) : default_environment(options.update_interval, logger_)),
  fs_(options.max_open_files, options.max_open_dirs),
  events_(options.log_events, logger_)
{
}

std::optional<std::string> Corpus::init()
{
  std::lock_guard lock(update_mu_);
  const auto start = std::chrono::steady_clock::now();

  events_.set_enabled(false);
  auto err = update_locked();
  events_.set_enabled(options_.log_events);
  if (err) {
    return err;
  }

  initialized_.store(true);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  logger_->debug("corpus: initialized {} packages in {}ms", registry_.size(), elapsed.count());
  return std::nullopt;
}

std::optional<std::string> Corpus::update()
{
  std::lock_guard lock(update_mu_);
  const auto start = std::chrono::steady_clock::now();

  auto err = update_locked();
  if (err) {
    return err;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  logger_->debug("corpus: updated in {}ms", elapsed.count());
  return std::nullopt;
}

std::optional<std::string> Corpus::update_locked()
{
  const std::vector<std::string> roots = env_->source_roots();
  if (roots.empty()) {
    return std::string("no source roots");
  }

  IndexContext ctx{
    *env_, fs_, registry_, idents_, strings_, events_, logger_, options_.index_identifiers};
  PackageIndexer indexer(ctx, roots, env_->standard_tree_root(), env_->revision());

  // dirs_ is only written under update_mu_, so it can be read unlocked here.
  std::vector<Directory> next;
  for (const auto & root : roots) {
    if (find_root(next, root) != nullptr) {
      continue;
    }

    TreeBuilder builder(ctx, indexer, options_.max_depth);
    const Directory * prev = find_root(dirs_, root);
    auto dir = prev != nullptr ? builder.update_root(*prev) : builder.build_root(root);
    if (dir) {
      next.push_back(std::move(*dir));
    }
  }

  for (const auto & prev : dirs_) {
    if (std::find(roots.begin(), roots.end(), prev.path) != roots.end()) {
      continue;
    }
    logger_->info("source root {} removed", prev.path);
    TreeBuilder builder(ctx, indexer, options_.max_depth);
    builder.delete_subtree(prev);
  }

  // Packages registered under a root that is no longer configured.
  for (const auto & root : registry_.roots()) {
    if (std::find(roots.begin(), roots.end(), root) != roots.end()) {
      continue;
    }
    for (const auto & pkg : registry_.remove_root(root)) {
      idents_.remove(pkg->dir);
      events_.emit(EventKind::Delete, pkg->dir);
    }
  }

  std::unique_lock lock(tree_mu_);
  dirs_.swap(next);
  return std::nullopt;
}

std::vector<std::string> Corpus::list_imports(std::string_view reference) const
{
  std::string ref(reference);
  if (path_ext(ref) == ".go") {
    ref = std::string(path_dir(ref));
  }

  std::vector<std::string> out;
  {
    std::shared_lock lock(tree_mu_);
    for (const auto & d : dirs_) {
      auto list = d.import_list(ref);
      out.insert(out.end(), list.begin(), list.end());
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::optional<Directory> Corpus::lookup(std::string_view path) const
{
  std::shared_lock lock(tree_mu_);
  for (const auto & d : dirs_) {
    if (const Directory * found = d.lookup(path)) {
      return *found;
    }
  }
  return std::nullopt;
}

PackagePtr Corpus::lookup_package(std::string_view dir) const
{
  return registry_.lookup_by_path(dir);
}

PackagePtr Corpus::lookup_by_name(std::string_view name) const
{
  return registry_.lookup_by_name(name);
}

std::vector<PackagePtr> Corpus::packages() const
{
  return registry_.packages();
}

std::vector<Directory> Corpus::dirs() const
{
  std::shared_lock lock(tree_mu_);
  return dirs_;
}

std::vector<Ident> Corpus::lookup_idents(TypKind kind, std::string_view name) const
{
  return idents_.lookup(kind, name);
}

std::vector<Ident> Corpus::exports(std::string_view dir) const
{
  return idents_.exports(dir);
}

std::vector<Event> Corpus::drain_events()
{
  return events_.drain();
}

void Corpus::set_event_handler(EventHandler handler)
{
  events_.set_handler(std::move(handler));
}

void Corpus::invalidate_environment()
{
  registry_.invalidate_environment();
}

}  // namespace pkgindex
