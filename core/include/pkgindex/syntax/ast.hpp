// pkgindex/syntax/ast.hpp - Top-level Go declarations
//
// The indexer only needs top-level names, so this tree stops at declaration
// granularity: function bodies, initializers and type bodies are skipped.
// All string views point into the SourceFile that was parsed.
//
#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "pkgindex/basic/source_file.hpp"

namespace pkgindex::syntax
{

// ============================================================================
// Leaf nodes
// ============================================================================

struct Name
{
  std::string_view text;
  SourceRange range;
};

struct PackageClause
{
  Name name;
  SourceRange range;  ///< "package" keyword through the name
};

struct ImportSpec
{
  std::optional<Name> alias;  ///< Explicit name, "." or "_"
  std::string_view path;      ///< Unquoted import path
  SourceRange range;
};

// ============================================================================
// Declarations
// ============================================================================

/**
 * A function or method declaration.
 *
 * For a method, receiver_type is the identifier of the receiver's base type
 * after unwrapping parentheses, pointers and type arguments. It is empty when
 * the receiver type is not an identifier.
 */
struct FuncDecl
{
  Name name;
  bool has_receiver = false;
  std::optional<Name> receiver_type;
  bool has_type_params = false;
  bool has_body = false;
  SourceRange range;
};

/// The keyword that introduces a general declaration.
enum class GenDeclKind : uint8_t {
  Const,
  Var,
  Type,
};

struct TypeSpec
{
  Name name;
  bool is_alias = false;  ///< type A = B
  bool has_type_params = false;
  SourceRange range;
};

struct ValueSpec
{
  std::vector<Name> names;
  SourceRange range;
};

/**
 * A const, var or type declaration. Type declarations populate type_specs;
 * const and var declarations populate value_specs.
 */
struct GenDecl
{
  GenDeclKind kind = GenDeclKind::Var;
  bool grouped = false;  ///< Parenthesized spec list
  std::vector<TypeSpec> type_specs;
  std::vector<ValueSpec> value_specs;
  SourceRange range;
};

using Decl = std::variant<FuncDecl, GenDecl>;

// ============================================================================
// File
// ============================================================================

struct FileAst
{
  PackageClause package;
  std::vector<ImportSpec> imports;
  std::vector<Decl> decls;
  std::vector<SourceRange> comments;  ///< Every comment in source order
};

}  // namespace pkgindex::syntax
