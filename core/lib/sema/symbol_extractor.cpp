// frugal_ls/sema/symbol_extractor.cpp - Symbol table extraction
#include "frugal_ls/sema/symbol_extractor.hpp"

#include <string_view>

#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls
{

namespace
{

namespace k = syntax::kind;

std::optional<Symbol> make_symbol(ts_ll::Node def, SymbolKind kind, const SourceManager & sm)
{
  const ts_ll::Node name = syntax::definition_name(def);
  if (name.is_null()) return std::nullopt;

  const std::string_view text = name.text(sm);
  if (text.empty()) return std::nullopt;

  Symbol s;
  s.name = std::string(text);
  s.kind = kind;
  s.declaration_range = name.position_range();
  s.full_range = def.position_range();
  s.node = def;
  return s;
}

void collect_members(
  ts_ll::Node body, std::string_view member_kind, SymbolKind kind, const SourceManager & sm,
  std::vector<Symbol> & out)
{
  if (body.is_null()) return;
  for (uint32_t i = 0; i < body.child_count(); ++i) {
    const ts_ll::Node c = body.child(i);
    if (c.kind() != member_kind) continue;
    if (auto s = make_symbol(c, kind, sm)) {
      out.push_back(std::move(*s));
    }
  }
}

}  // namespace

std::vector<Symbol> extract_symbols(ts_ll::Node root, const SourceManager & sm)
{
  std::vector<Symbol> symbols;

  syntax::walk_preorder(root, [&](ts_ll::Node n) {
    const auto kind = symbol_kind_for_definition(n.kind());
    if (!kind) return;
    if (auto s = make_symbol(n, *kind, sm)) {
      symbols.push_back(std::move(*s));
    }
  });

  return symbols;
}

std::vector<Symbol> extract_members(const Symbol & parent, const SourceManager & sm)
{
  std::vector<Symbol> members;
  const ts_ll::Node def = parent.node;
  if (def.is_null()) return members;

  switch (parent.kind) {
    case SymbolKind::Struct:
    case SymbolKind::Exception:
      collect_members(
        syntax::first_child_of_kind(def, k::k_struct_body), k::k_field, SymbolKind::Field, sm,
        members);
      break;
    case SymbolKind::Service:
      collect_members(
        syntax::first_child_of_kind(def, k::k_service_body), k::k_function_definition,
        SymbolKind::Method, sm, members);
      break;
    case SymbolKind::Enum:
      collect_members(
        syntax::first_child_of_kind(def, k::k_enum_body), k::k_enum_field, SymbolKind::EnumValue,
        sm, members);
      break;
    case SymbolKind::Scope:
      collect_members(
        syntax::first_child_of_kind(def, k::k_scope_body), k::k_scope_operation,
        SymbolKind::Method, sm, members);
      break;
    default:
      break;
  }

  return members;
}

}  // namespace frugal_ls
