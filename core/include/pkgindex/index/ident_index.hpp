// pkgindex/index/ident_index.hpp - Identifier tables
//
// Two views over the same records:
//   by kind:    TypKind -> bare name -> declarations across all packages
//   by package: package dir -> qualified name -> declarations
//
// A qualified name may repeat within a package (several init functions,
// or conflicting declarations in files of one package); every declaration
// is kept.
//
// The index has its own lock. Callers that also hold the registry lock must
// take it first.
//
#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pkgindex/index/ident.hpp"

namespace pkgindex
{

class IdentIndex
{
public:
  IdentIndex() = default;

  IdentIndex(const IdentIndex &) = delete;
  IdentIndex & operator=(const IdentIndex &) = delete;

  /**
   * Replace every identifier of the package in dir with idents.
   *
   * dir must outlive the index (pass an interned view).
   */
  void replace(std::string_view dir, std::vector<Ident> idents);

  /// Drop the package in dir; returns whether it was indexed.
  bool remove(std::string_view dir);

  /// Declarations of name with the given kind, ordered by file and offset.
  [[nodiscard]] std::vector<Ident> lookup(TypKind kind, std::string_view name) const;

  /// Identifiers of the package in dir ordered by qualified name, then by
  /// file and offset.
  [[nodiscard]] std::vector<Ident> exports(std::string_view dir) const;

  [[nodiscard]] std::vector<Ident> all() const;

  [[nodiscard]] size_t package_count() const;
  [[nodiscard]] bool contains(std::string_view dir) const;

private:
  using NameTable = std::unordered_map<std::string_view, std::vector<Ident>>;

  struct PackageIdents
  {
    std::vector<Ident> idents;            ///< Every declaration, in file order
    std::multimap<std::string, Ident> exports; ///< Keyed by qualified name
  };

  void erase_locked(std::string_view dir);

  mutable std::shared_mutex mu_;
  std::array<NameTable, k_typ_kind_count> by_kind_;
  std::unordered_map<std::string_view, PackageIdents> by_package_;
};

}  // namespace pkgindex
