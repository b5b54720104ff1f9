// pkgindex/basic/diagnostic.hpp - Diagnostics produced while reading source
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pkgindex/basic/source_file.hpp"

namespace pkgindex
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string message;
  SourceRange range;
};

/**
 * Render a diagnostic as "<path>:<line>:<col>: <severity>: <message>".
 */
[[nodiscard]] std::string format_diagnostic(const Diagnostic & diag, const SourceFile & file);

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  void report_error(SourceRange range, std::string message);
  void report_warning(SourceRange range, std::string message);

  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  /// First error, or nullptr when there is none.
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

  void clear() { diagnostics_.clear(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace pkgindex
