// pkgindex/index/package_indexer.cpp - Per-directory package indexing
#include "pkgindex/index/package_indexer.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "pkgindex/basic/diagnostic.hpp"
#include "pkgindex/basic/path_util.hpp"
#include "pkgindex/basic/source_file.hpp"
#include "pkgindex/index/ident_collector.hpp"
#include "pkgindex/syntax/parser.hpp"

namespace pkgindex
{

namespace
{

// Package clauses sit near the top of a file; read in small pieces.
constexpr size_t k_clause_chunk = 4096;

bool same_classes(const Package & a, const Package & b)
{
  for (FileKind kind : {FileKind::GoFile, FileKind::TestGoFile, FileKind::IgnoredGoFile}) {
    if (a.file_names(kind) != b.file_names(kind)) {
      return false;
    }
  }
  return true;
}

}  // namespace

PackageIndexer::PackageIndexer(
  IndexContext & ctx, std::vector<std::string> roots, std::string standard_root, uint64_t revision)
: ctx_(ctx), roots_(std::move(roots)), standard_root_(std::move(standard_root)), revision_(revision)
{
}

std::optional<std::string> PackageIndexer::src_root_for(std::string_view dir) const
{
  const std::string * best = nullptr;
  for (const auto & root : roots_) {
    if (has_root(dir, root) && (best == nullptr || root.size() > best->size())) {
      best = &root;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

Package PackageIndexer::new_package(const std::string & dir, const std::string & src_root) const
{
  Package pkg;
  pkg.dir = dir;
  pkg.src_root = src_root;
  pkg.import_path = std::string(trim_path_prefix(dir, src_root));
  pkg.root = std::string(path_dir(src_root));
  pkg.is_in_standard_tree = !standard_root_.empty() && src_root == standard_root_;
  return pkg;
}

// ============================================================================
// File set
// ============================================================================

std::vector<std::string> PackageIndexer::refresh_files(Package & pkg, bool & files_changed)
{
  std::vector<std::string> stale;
  std::vector<std::string> vanished;

  pkg.for_each_file([&](FileKind, File & file) {
    auto st = ctx_.fs.lstat(file.path);
    if (!st || st->is_dir) {
      if (!st) {
        ctx_.logger->trace("dropping {}", st.error().message());
      }
      vanished.push_back(file.name);
      return;
    }
    if (!file.stat.same_as(*st)) {
      file.stat = std::move(*st);
      file.forget_clause();
      stale.push_back(file.name);
    }
  });

  for (const auto & name : vanished) {
    pkg.remove_file(name);
    files_changed = true;
  }
  return stale;
}

std::vector<std::string> PackageIndexer::merge_listing(
  Package & pkg, const std::vector<fs::FileStat> & listing, bool & files_changed)
{
  std::vector<std::string> stale;
  std::set<std::string, std::less<>> seen;

  for (const auto & entry : listing) {
    if (entry.is_dir || !is_go_file_name(entry.name)) {
      continue;
    }
    seen.insert(entry.name);

    if (File * file = pkg.lookup_file(entry.name)) {
      if (!file->stat.same_as(entry)) {
        file->stat = entry;
        file->forget_clause();
        stale.push_back(entry.name);
      }
      continue;
    }

    File file;
    file.name = entry.name;
    file.path = path_join(pkg.dir, entry.name);
    file.stat = entry;
    // Placeholder class; classify() decides.
    pkg.add_file(FileKind::IgnoredGoFile, std::move(file));
    stale.push_back(entry.name);
    files_changed = true;
  }

  std::vector<std::string> vanished;
  for (const File * file : pkg.files()) {
    if (seen.find(file->name) == seen.end()) {
      vanished.push_back(file->name);
    }
  }
  for (const auto & name : vanished) {
    pkg.remove_file(name);
    files_changed = true;
  }
  return stale;
}

FileKind PackageIndexer::classify(const std::string & dir, const std::string & name) const
{
  if (is_go_test_file_name(name)) {
    return FileKind::TestGoFile;
  }
  if (ctx_.env.match_file(dir, name)) {
    return FileKind::GoFile;
  }
  return FileKind::IgnoredGoFile;
}

// ============================================================================
// Package name
// ============================================================================

std::optional<std::string> PackageIndexer::read_package_clause(const std::string & path)
{
  auto file = ctx_.fs.open_file(path);
  if (!file) {
    ctx_.logger->debug("package clause: {}", file.error().message());
    return std::nullopt;
  }

  std::string buf;
  for (;;) {
    auto chunk = file->read(k_clause_chunk);
    if (!chunk) {
      ctx_.logger->debug("package clause: {}", chunk.error().message());
      return std::nullopt;
    }
    const bool eof = chunk->empty();
    buf += *chunk;

    auto name = syntax::parse_package_name(buf);
    // A name touching the end of the buffer may continue in the next chunk.
    if (name && (eof || name->data() + name->size() < buf.data() + buf.size())) {
      return std::string(*name);
    }
    if (eof) {
      return std::nullopt;
    }
  }
}

void PackageIndexer::ensure_clause(File & file)
{
  if (file.clause != ClauseState::Unknown) {
    return;
  }
  if (auto name = read_package_clause(file.path)) {
    file.clause_name = std::move(*name);
    file.clause = ClauseState::Parsed;
  } else {
    file.clause_name.clear();
    file.clause = ClauseState::Failed;
  }
}

void PackageIndexer::resolve_name(Package & pkg)
{
  pkg.name.clear();
  pkg.error = PackageError{};

  std::string first_name;
  std::string first_file;

  // A buildable file without a readable package clause stays buildable but
  // contributes no name.
  for (const auto & name : pkg.file_names(FileKind::GoFile)) {
    File * file = pkg.lookup_file(name);
    ensure_clause(*file);
    if (file->clause == ClauseState::Failed) {
      continue;
    }
    if (first_name.empty()) {
      first_name = file->clause_name;
      first_file = name;
    } else if (file->clause_name != first_name) {
      pkg.error = PackageError::multiple_packages(
        pkg.dir, {first_name, file->clause_name}, {first_file, name});
      break;
    }
  }

  if (!first_name.empty()) {
    pkg.name = std::move(first_name);
    return;
  }

  for (FileKind kind : {FileKind::IgnoredGoFile, FileKind::TestGoFile}) {
    for (const auto & name : pkg.file_names(kind)) {
      File * file = pkg.lookup_file(name);
      ensure_clause(*file);
      if (file->clause == ClauseState::Parsed) {
        pkg.name = file->clause_name;
        break;
      }
    }
    if (!pkg.name.empty()) {
      break;
    }
  }
  pkg.error = PackageError::no_buildable_sources(pkg.dir);
}

// ============================================================================
// Installed check
// ============================================================================

bool PackageIndexer::is_installed(const Package & pkg) const
{
  std::string target;
  if (pkg.is_command()) {
    target = path_join(path_join(pkg.root, "bin"), path_base(pkg.import_path));
  } else {
    auto tp = ctx_.env.target_path(pkg.import_path);
    if (!tp) {
      return false;
    }
    target = path_join(pkg.root, tp->archive);
  }
  auto st = ctx_.fs.stat(target);
  return st && st->is_regular();
}

// ============================================================================
// Identifiers
// ============================================================================

void PackageIndexer::index_identifiers(const Package & pkg)
{
  std::vector<Ident> idents;
  for (const File * file : pkg.files(FileKind::GoFile)) {
    auto content = ctx_.fs.read_file(file->path);
    if (!content) {
      ctx_.logger->debug("identifiers: {}", content.error().message());
      continue;
    }

    SourceFile source(file->path, std::move(*content));
    DiagnosticBag diags;
    auto ast = syntax::parse_declarations(source, diags);
    if (!ast || diags.has_errors()) {
      if (const Diagnostic * err = diags.first_error()) {
        ctx_.logger->trace("identifiers: {}", format_diagnostic(*err, source));
      }
      continue;
    }

    auto found = collect_file_idents(
      *ast, source, IdentScope{pkg.name, pkg.import_path, file->path}, ctx_.strings);
    idents.insert(idents.end(), found.begin(), found.end());
  }
  ctx_.idents.replace(ctx_.strings.intern(pkg.dir), std::move(idents));
}

// ============================================================================
// Index / remove
// ============================================================================

IndexResult PackageIndexer::index(
  const std::string & dir, const fs::FileStat & dir_stat, const std::vector<fs::FileStat> * listing)
{
  auto src_root = src_root_for(dir);
  if (!src_root) {
    return {nullptr, PackageError::no_go_files(dir)};
  }

  const PackagePtr prev = ctx_.registry.lookup(*src_root, trim_path_prefix(dir, *src_root));
  Package pkg = prev ? *prev : new_package(dir, *src_root);

  bool files_changed = !prev;
  std::vector<std::string> stale;
  if (prev && listing == nullptr && fs::same_file(prev->stat, dir_stat)) {
    stale = refresh_files(pkg, files_changed);
  } else {
    std::optional<fs::FsResult<std::vector<fs::FileStat>>> fresh;
    static const std::vector<fs::FileStat> k_empty;
    const std::vector<fs::FileStat> * entries = listing;
    if (entries == nullptr) {
      fresh.emplace(ctx_.fs.readdir(dir));
      if (*fresh) {
        entries = &fresh->value();
      } else {
        ctx_.logger->debug("package: {}", fresh->error().message());
        entries = &k_empty;
      }
    }
    stale = merge_listing(pkg, *entries, files_changed);
    pkg.stat = dir_stat;
  }

  // Files are reclassified when they changed or the environment did.
  std::vector<std::string> to_classify;
  if (pkg.classified_revision != revision_) {
    to_classify = pkg.file_names();
  } else {
    to_classify = std::move(stale);
  }
  const bool content_changed = !to_classify.empty() || files_changed;
  for (const auto & name : to_classify) {
    File * file = pkg.lookup_file(name);
    if (file == nullptr) {
      continue;
    }
    pkg.add_file(classify(dir, name), File(*file));
  }
  pkg.classified_revision = revision_;

  if (pkg.file_count() == 0) {
    if (prev) {
      remove(dir);
    }
    return {nullptr, PackageError::no_go_files(dir)};
  }

  resolve_name(pkg);
  pkg.installed = is_installed(pkg);

  const bool is_new = !prev;
  const bool changed =
    is_new || prev->name != pkg.name || prev->error != pkg.error || !same_classes(*prev, pkg);
  auto snapshot = std::make_shared<const Package>(std::move(pkg));
  ctx_.registry.insert(snapshot);

  if (ctx_.index_identifiers && (content_changed || changed)) {
    if (snapshot->error.kind == PackageErrorKind::MultiplePackages) {
      ctx_.idents.remove(dir);
    } else {
      index_identifiers(*snapshot);
    }
  }

  // Listeners see the package together with its identifiers.
  if (is_new) {
    ctx_.events.emit(EventKind::Create, dir);
  } else if (changed) {
    ctx_.events.emit(EventKind::Update, dir);
  }

  return {snapshot, snapshot->error};
}

void PackageIndexer::remove(const std::string & dir)
{
  PackagePtr removed = ctx_.registry.remove_by_dir(dir);
  if (!removed) {
    return;
  }
  ctx_.idents.remove(dir);
  ctx_.events.emit(EventKind::Delete, dir);
}

}  // namespace pkgindex
