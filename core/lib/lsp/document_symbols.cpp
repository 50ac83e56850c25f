// frugal_ls/lsp/document_symbols.cpp
#include "frugal_ls/lsp/document_symbols.hpp"

#include <algorithm>
#include <cctype>

#include "frugal_ls/sema/symbol_extractor.hpp"

namespace frugal_ls::lsp
{

namespace
{

char ascii_lower(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle)
{
  if (needle.empty()) return true;
  const auto it = std::search(
    haystack.begin(), haystack.end(), needle.begin(), needle.end(),
    [](char a, char b) { return ascii_lower(a) == ascii_lower(b); });
  return it != haystack.end();
}

DocumentSymbol to_document_symbol(const Symbol & sym, std::string_view detail)
{
  DocumentSymbol out;
  out.name = sym.name;
  out.detail = std::string(detail);
  out.kind = sym.kind;
  out.range = sym.full_range;
  out.selection_range = sym.declaration_range;
  return out;
}

std::string_view member_detail(const Symbol & parent, const Symbol & member)
{
  switch (member.kind) {
    case SymbolKind::Field:
      return "Field";
    case SymbolKind::EnumValue:
      return "Enum Value";
    case SymbolKind::Method:
      return parent.kind == SymbolKind::Scope ? "Event" : "Method";
    default:
      return display_name(member.kind);
  }
}

}  // namespace

std::string_view symbol_detail(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "Service";
    case SymbolKind::Scope:
      return "Scope (pub/sub)";
    case SymbolKind::Struct:
      return "Struct";
    case SymbolKind::Enum:
      return "Enum";
    case SymbolKind::Const:
      return "Constant";
    case SymbolKind::Typedef:
      return "Type Alias";
    case SymbolKind::Exception:
      return "Exception";
    case SymbolKind::Field:
      return "Field";
    case SymbolKind::Parameter:
      return "Parameter";
    case SymbolKind::EnumValue:
      return "Enum Value";
    case SymbolKind::Method:
      return "Method";
  }
  return "";
}

std::vector<DocumentSymbol> document_symbols(const Document & doc)
{
  std::vector<DocumentSymbol> out;

  for (const auto & sym : doc.symbols()) {
    DocumentSymbol entry = to_document_symbol(sym, symbol_detail(sym.kind));
    for (const auto & member : extract_members(sym, doc.source())) {
      entry.children.push_back(to_document_symbol(member, member_detail(sym, member)));
    }
    out.push_back(std::move(entry));
  }

  return out;
}

std::vector<SymbolInformation> workspace_symbols(
  std::string_view query, const DocumentSet & docs, gsl::span<const std::string> extensions)
{
  std::vector<SymbolInformation> out;

  for (const auto & [uri, doc] : docs) {
    if (doc == nullptr || !doc->is_analyzable(extensions)) continue;
    for (const auto & sym : doc->symbols()) {
      if (!contains_ignore_case(sym.name, query)) continue;
      out.push_back(SymbolInformation{sym.name, sym.kind, Location{uri, sym.declaration_range}});
    }
  }

  return out;
}

}  // namespace frugal_ls::lsp
