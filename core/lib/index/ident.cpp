// pkgindex/index/ident.cpp - Identifier kinds, positions and records
#include "pkgindex/index/ident.hpp"

#include <array>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace pkgindex
{

namespace
{

constexpr std::array<std::string_view, k_typ_kind_count> k_typ_kind_names = {
  "InvalidDecl", "ConstDecl", "VarDecl", "TypeDecl", "FuncDecl", "MethodDecl", "InterfaceDecl",
};

}  // namespace

std::string_view to_string(TypKind kind) noexcept
{
  if (!is_valid(kind)) {
    return k_typ_kind_names[0];
  }
  return k_typ_kind_names[static_cast<size_t>(kind)];
}

std::optional<TypKind> typ_kind_from_string(std::string_view name) noexcept
{
  for (size_t i = 0; i < k_typ_kind_names.size(); ++i) {
    if (k_typ_kind_names[i] == name) {
      return static_cast<TypKind>(i);
    }
  }
  return std::nullopt;
}

TypInfo TypInfo::make(TypKind kind, int64_t offset, int64_t line) noexcept
{
  uint64_t bits = 0;
  if (offset >= 0 && offset <= std::numeric_limits<uint32_t>::max()) {
    bits = static_cast<uint64_t>(offset) << 32;
  }
  if (line >= 0 && static_cast<uint64_t>(line) <= k_line_mask) {
    bits |= static_cast<uint64_t>(line) << 4;
  }
  bits |= static_cast<uint64_t>(kind) & 7U;
  return TypInfo(bits);
}

std::string Ident::qualified_name() const
{
  if (recv.empty()) {
    return std::string(name);
  }
  return fmt::format("{}.{}", recv, name);
}

bool Ident::is_exported() const noexcept
{
  // Go identifiers are Unicode, but only ASCII upper case is recognized here.
  return !name.empty() && name.front() >= 'A' && name.front() <= 'Z';
}

void to_json(nlohmann::json & j, TypKind kind)
{
  j = std::string(to_string(kind));
}

void from_json(const nlohmann::json & j, TypKind & kind)
{
  const auto name = j.get<std::string>();
  auto parsed = typ_kind_from_string(name);
  if (!parsed) {
    throw std::invalid_argument(fmt::format("invalid TypKind \"{}\"", name));
  }
  kind = *parsed;
}

void to_json(nlohmann::json & j, const TypInfo & info)
{
  j = nlohmann::json{
    {"Kind", info.kind()},
    {"Line", info.line()},
    {"Offset", info.offset()},
  };
}

void from_json(const nlohmann::json & j, TypInfo & info)
{
  const auto kind = j.at("Kind").get<TypKind>();
  const auto line = j.at("Line").get<int64_t>();
  const auto offset = j.at("Offset").get<int64_t>();
  info = TypInfo::make(kind, offset, line);
}

void to_json(nlohmann::json & j, const Ident & ident)
{
  j = nlohmann::json{
    {"Name", std::string(ident.name)},
    {"Recv", std::string(ident.recv)},
    {"Package", std::string(ident.package_name)},
    {"Path", std::string(ident.import_path)},
    {"File", std::string(ident.file)},
    {"Info", ident.info},
  };
}

}  // namespace pkgindex
