// frugal_ls/sema/symbol.hpp - Symbol records derived from the CST
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

enum class SymbolKind : uint8_t {
  Service,
  Scope,
  Struct,
  Enum,
  Const,
  Typedef,
  Exception,
  Field,
  Parameter,
  EnumValue,
  Method,
};

/// Lower-case keyword spelling ("struct", "enum value", ...), used in messages
[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

/// Capitalised spelling ("Struct", "EnumValue", ...)
[[nodiscard]] std::string_view display_name(SymbolKind kind) noexcept;

/// Symbol kind produced by a top-level definition node kind, if any
[[nodiscard]] std::optional<SymbolKind> symbol_kind_for_definition(
  std::string_view node_kind) noexcept;

/// True for kinds that can be used as a field type (struct, exception, enum, typedef)
[[nodiscard]] bool is_type_symbol(SymbolKind kind) noexcept;

/**
 * A named definition.
 *
 * `node` is a non-owning view into the tree the symbol was extracted from and
 * is only valid while that tree is alive.
 */
struct Symbol
{
  std::string name;  ///< never empty
  SymbolKind kind = SymbolKind::Struct;
  Range declaration_range;  ///< the name token
  Range full_range;         ///< the whole definition
  ts_ll::Node node;
};

}  // namespace frugal_ls
