// pkgindex/index/ident.hpp - Identifier kinds, positions and records
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pkgindex
{

// ============================================================================
// TypKind
// ============================================================================

/// Kind of a top-level Go identifier.
enum class TypKind : uint8_t {
  Invalid,
  Const,
  Var,
  Type,
  Func,
  Method,
  Interface,
};

inline constexpr size_t k_typ_kind_count = 7;

// TypInfo reserves three bits for the kind.
static_assert(k_typ_kind_count <= 8, "TypKind must fit in three bits");

/// "ConstDecl", "FuncDecl", ...; "InvalidDecl" for out of range values.
[[nodiscard]] std::string_view to_string(TypKind kind) noexcept;

[[nodiscard]] std::optional<TypKind> typ_kind_from_string(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_valid(TypKind kind) noexcept
{
  return static_cast<size_t>(kind) < k_typ_kind_count;
}

// ============================================================================
// TypInfo
// ============================================================================

/**
 * Kind and position of an identifier packed into 64 bits:
 *
 *   bits  0-2   kind
 *   bit   3     unused
 *   bits  4-31  line (28 bits)
 *   bits 32-63  byte offset
 *
 * An offset or line that does not fit is stored as 0; the other fields are
 * kept.
 */
class TypInfo
{
public:
  constexpr TypInfo() noexcept = default;

  [[nodiscard]] static TypInfo make(TypKind kind, int64_t offset, int64_t line) noexcept;

  /// Wrap an already packed value.
  [[nodiscard]] static constexpr TypInfo from_raw(uint64_t bits) noexcept { return TypInfo(bits); }

  [[nodiscard]] constexpr TypKind kind() const noexcept
  {
    return static_cast<TypKind>(bits_ & 7U);
  }
  [[nodiscard]] constexpr uint32_t line() const noexcept
  {
    return static_cast<uint32_t>((bits_ >> 4) & k_line_mask);
  }
  [[nodiscard]] constexpr uint32_t offset() const noexcept
  {
    return static_cast<uint32_t>(bits_ >> 32);
  }
  [[nodiscard]] constexpr uint64_t raw() const noexcept { return bits_; }

  constexpr bool operator==(const TypInfo & other) const noexcept = default;

  static constexpr uint64_t k_line_mask = 0xfffffff;

private:
  constexpr explicit TypInfo(uint64_t bits) noexcept : bits_(bits) {}

  uint64_t bits_ = 0;
};

// ============================================================================
// Ident
// ============================================================================

/**
 * One declaration of a top-level identifier.
 *
 * String members are views into the Corpus string pool and stay valid for
 * the lifetime of the Corpus that produced them.
 */
struct Ident
{
  std::string_view name;
  std::string_view recv;  ///< Receiver base type for methods
  std::string_view package_name;
  std::string_view import_path;
  std::string_view file;  ///< Absolute path of the declaring file
  TypInfo info;

  /// "Recv.Name" for methods, otherwise the bare name.
  [[nodiscard]] std::string qualified_name() const;

  /// Whether name starts with an upper case letter.
  [[nodiscard]] bool is_exported() const noexcept;

  bool operator==(const Ident & other) const = default;
};

// ============================================================================
// JSON projection
// ============================================================================

void to_json(nlohmann::json & j, TypKind kind);
void from_json(const nlohmann::json & j, TypKind & kind);

/// {"Kind": "FuncDecl", "Line": 12, "Offset": 140}
void to_json(nlohmann::json & j, const TypInfo & info);
void from_json(const nlohmann::json & j, TypInfo & info);

void to_json(nlohmann::json & j, const Ident & ident);

}  // namespace pkgindex
