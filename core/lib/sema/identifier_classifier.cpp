// frugal_ls/sema/identifier_classifier.cpp
#include "frugal_ls/sema/identifier_classifier.hpp"

#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls
{

namespace
{

namespace k = syntax::kind;

IdentifierInfo declaration(SymbolKind kind)
{
  return IdentifierInfo{IdentifierRole::Declaration, kind};
}

}  // namespace

IdentifierInfo classify_identifier(ts_ll::Node identifier)
{
  if (identifier.is_null() || identifier.kind() != k::k_identifier) {
    return {};
  }

  const ts_ll::Node parent = identifier.parent();
  if (parent.is_null()) {
    return {};
  }

  const std::string_view pk = parent.kind();

  if (syntax::is_definition_kind(pk)) {
    if (syntax::definition_name(parent) == identifier) {
      if (pk == k::k_function_definition) {
        return declaration(SymbolKind::Method);
      }
      if (const auto kind = symbol_kind_for_definition(pk)) {
        return declaration(*kind);
      }
    }
    return IdentifierInfo{IdentifierRole::Reference, std::nullopt};
  }

  // Field names are the field's only direct identifier; types and default
  // values are wrapped in field_type / const_value.
  if (pk == k::k_field) {
    const ts_ll::Node container = parent.parent();
    if (!container.is_null() && container.kind() == k::k_field_list) {
      return declaration(SymbolKind::Parameter);
    }
    return declaration(SymbolKind::Field);
  }

  if (pk == k::k_enum_field) {
    return declaration(SymbolKind::EnumValue);
  }

  if (pk == k::k_scope_operation) {
    return declaration(SymbolKind::Method);
  }

  if (pk == k::k_qualified_identifier) {
    // `Color.RED` as a constant value is a value reference, not a type
    const ts_ll::Node outer = parent.parent();
    if (!outer.is_null() && outer.kind() == k::k_const_value) {
      return IdentifierInfo{IdentifierRole::Reference, std::nullopt};
    }
    return IdentifierInfo{IdentifierRole::TypeReference, std::nullopt};
  }

  if (pk == k::k_field_type || pk == k::k_service_extends) {
    return IdentifierInfo{IdentifierRole::TypeReference, std::nullopt};
  }

  return IdentifierInfo{IdentifierRole::Reference, std::nullopt};
}

}  // namespace frugal_ls
