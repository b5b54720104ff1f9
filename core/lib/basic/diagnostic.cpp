// pkgindex/basic/diagnostic.cpp - Diagnostic implementation
#include "pkgindex/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace pkgindex
{

std::string format_diagnostic(const Diagnostic & diag, const SourceFile & file)
{
  const char * severity = diag.severity == Severity::Error ? "error" : "warning";
  if (!diag.range.is_valid()) {
    return fmt::format("{}: {}: {}", file.path(), severity, diag.message);
  }
  const auto lc = file.line_column(diag.range.begin);
  return fmt::format("{}:{}:{}: {}: {}", file.path(), lc.line, lc.column, severity, diag.message);
}

// ============================================================================
// DiagnosticBag
// ============================================================================

void DiagnosticBag::report_error(SourceRange range, std::string message)
{
  add(Diagnostic{Severity::Error, std::move(message), range});
}

void DiagnosticBag::report_warning(SourceRange range, std::string message)
{
  add(Diagnostic{Severity::Warning, std::move(message), range});
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

const Diagnostic * DiagnosticBag::first_error() const noexcept
{
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Error) {
      return &d;
    }
  }
  return nullptr;
}

}  // namespace pkgindex
