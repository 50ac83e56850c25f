// frugal_ls/sema/symbol.cpp
#include "frugal_ls/sema/symbol.hpp"

#include "frugal_ls/syntax/node_kinds.hpp"

namespace frugal_ls
{

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "service";
    case SymbolKind::Scope:
      return "scope";
    case SymbolKind::Struct:
      return "struct";
    case SymbolKind::Enum:
      return "enum";
    case SymbolKind::Const:
      return "const";
    case SymbolKind::Typedef:
      return "typedef";
    case SymbolKind::Exception:
      return "exception";
    case SymbolKind::Field:
      return "field";
    case SymbolKind::Parameter:
      return "parameter";
    case SymbolKind::EnumValue:
      return "enum value";
    case SymbolKind::Method:
      return "method";
  }
  return "symbol";
}

std::string_view display_name(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "Service";
    case SymbolKind::Scope:
      return "Scope";
    case SymbolKind::Struct:
      return "Struct";
    case SymbolKind::Enum:
      return "Enum";
    case SymbolKind::Const:
      return "Const";
    case SymbolKind::Typedef:
      return "Typedef";
    case SymbolKind::Exception:
      return "Exception";
    case SymbolKind::Field:
      return "Field";
    case SymbolKind::Parameter:
      return "Parameter";
    case SymbolKind::EnumValue:
      return "EnumValue";
    case SymbolKind::Method:
      return "Method";
  }
  return "Symbol";
}

std::optional<SymbolKind> symbol_kind_for_definition(std::string_view node_kind) noexcept
{
  namespace k = syntax::kind;
  if (node_kind == k::k_service_definition) return SymbolKind::Service;
  if (node_kind == k::k_scope_definition) return SymbolKind::Scope;
  if (node_kind == k::k_struct_definition) return SymbolKind::Struct;
  if (node_kind == k::k_enum_definition) return SymbolKind::Enum;
  if (node_kind == k::k_const_definition) return SymbolKind::Const;
  if (node_kind == k::k_typedef_definition) return SymbolKind::Typedef;
  if (node_kind == k::k_exception_definition) return SymbolKind::Exception;
  return std::nullopt;
}

bool is_type_symbol(SymbolKind kind) noexcept
{
  return kind == SymbolKind::Struct || kind == SymbolKind::Exception ||
         kind == SymbolKind::Enum || kind == SymbolKind::Typedef;
}

}  // namespace frugal_ls
