// pkgindex/index/ident_collector.hpp - Top-level identifiers of parsed files
#pragma once

#include <string_view>
#include <vector>

#include "pkgindex/basic/source_file.hpp"
#include "pkgindex/basic/string_interner.hpp"
#include "pkgindex/index/ident.hpp"
#include "pkgindex/syntax/ast.hpp"

namespace pkgindex
{

/// Package and file an identifier is recorded against.
struct IdentScope
{
  std::string_view package_name;
  std::string_view import_path;
  std::string_view file;
};

/**
 * Collect the identifiers declared at the top level of ast.
 *
 * Functions become Func, methods become Method keyed by their receiver's
 * base type, type specs become Type and value specs become Const or Var by
 * their declaration keyword. Blank identifiers and methods whose receiver
 * is not a named type are skipped. Every string in the result is interned.
 */
[[nodiscard]] std::vector<Ident> collect_file_idents(
  const syntax::FileAst & ast, const SourceFile & source, const IdentScope & scope,
  StringInterner & strings);

}  // namespace pkgindex
