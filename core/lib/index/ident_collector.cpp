// pkgindex/index/ident_collector.cpp - Top-level identifiers of parsed files
#include "pkgindex/index/ident_collector.hpp"

#include <utility>
#include <variant>

namespace pkgindex
{

namespace
{

class IdentCollector
{
public:
  IdentCollector(const SourceFile & source, const IdentScope & scope, StringInterner & strings)
  : source_(source), strings_(strings)
  {
    scope_.package_name = strings_.intern(scope.package_name);
    scope_.import_path = strings_.intern(scope.import_path);
    scope_.file = strings_.intern(scope.file);
  }

  void visit(const syntax::FuncDecl & fn)
  {
    if (!fn.has_receiver) {
      add(TypKind::Func, fn.name, {});
      return;
    }
    if (fn.receiver_type) {
      add(TypKind::Method, fn.name, fn.receiver_type->text);
    }
  }

  void visit(const syntax::GenDecl & decl)
  {
    for (const auto & spec : decl.type_specs) {
      add(TypKind::Type, spec.name, {});
    }

    TypKind kind = TypKind::Var;
    switch (decl.kind) {
      case syntax::GenDeclKind::Const:
        kind = TypKind::Const;
        break;
      case syntax::GenDeclKind::Var:
        kind = TypKind::Var;
        break;
      case syntax::GenDeclKind::Type:
        kind = TypKind::Type;
        break;
    }
    for (const auto & spec : decl.value_specs) {
      for (const auto & name : spec.names) {
        add(kind, name, {});
      }
    }
  }

  std::vector<Ident> take() { return std::move(idents_); }

private:
  void add(TypKind kind, const syntax::Name & name, std::string_view recv)
  {
    if (name.text.empty() || name.text == "_") {
      return;
    }

    Ident ident = scope_;
    ident.name = strings_.intern(name.text);
    if (!recv.empty()) {
      ident.recv = strings_.intern(recv);
    }
    ident.info = position_info(kind, name.range);
    idents_.push_back(ident);
  }

  // Positions outside the file are recorded as zero.
  [[nodiscard]] TypInfo position_info(TypKind kind, SourceRange range) const
  {
    if (!range.is_valid() || range.begin > source_.size()) {
      return TypInfo::make(kind, 0, 0);
    }
    const LineColumn lc = source_.line_column(range.begin);
    return TypInfo::make(kind, range.begin, lc.line);
  }

  const SourceFile & source_;
  StringInterner & strings_;
  Ident scope_;
  std::vector<Ident> idents_;
};

}  // namespace

std::vector<Ident> collect_file_idents(
  const syntax::FileAst & ast, const SourceFile & source, const IdentScope & scope,
  StringInterner & strings)
{
  IdentCollector collector(source, scope, strings);
  for (const auto & decl : ast.decls) {
    std::visit([&](const auto & d) { collector.visit(d); }, decl);
  }
  return collector.take();
}

}  // namespace pkgindex
