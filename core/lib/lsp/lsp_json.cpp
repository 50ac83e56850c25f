// frugal_ls/lsp/lsp_json.cpp
#include "frugal_ls/lsp/lsp_json.hpp"

#include <string>

namespace frugal_ls::lsp
{

int to_lsp_symbol_kind(SymbolKind kind) noexcept
{
  // Values from the LSP SymbolKind enumeration
  switch (kind) {
    case SymbolKind::Service:
    case SymbolKind::Scope:
    case SymbolKind::Exception:
      return 5;  // Class
    case SymbolKind::Method:
      return 6;
    case SymbolKind::Field:
      return 8;
    case SymbolKind::Enum:
      return 10;
    case SymbolKind::Parameter:
      return 13;  // Variable
    case SymbolKind::Const:
      return 14;  // Constant
    case SymbolKind::EnumValue:
      return 22;  // EnumMember
    case SymbolKind::Struct:
      return 23;
    case SymbolKind::Typedef:
      return 26;  // TypeParameter
  }
  return 13;
}

int to_lsp_severity(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return 1;
    case Severity::Warning:
      return 2;
    case Severity::Info:
      return 3;
    case Severity::Hint:
      return 4;
  }
  return 1;
}

json position_to_json(const Position & pos)
{
  return json{{"line", pos.line}, {"character", pos.character}};
}

json range_to_json(const Range & range)
{
  return json{{"start", position_to_json(range.start)}, {"end", position_to_json(range.end)}};
}

json location_to_json(const Location & loc)
{
  return json{{"uri", loc.uri}, {"range", range_to_json(loc.range)}};
}

json diagnostic_to_json(const Diagnostic & diag, std::string_view uri)
{
  json item;
  item["range"] = range_to_json(diag.range);
  item["severity"] = to_lsp_severity(diag.severity);
  item["source"] = diag.source;
  item["message"] = diag.message;
  if (!diag.code.empty()) {
    item["code"] = diag.code;
  }

  json related = json::array();
  for (const auto & rel : diag.related) {
    const std::string rel_uri = rel.uri.empty() ? std::string(uri) : rel.uri;
    related.push_back(json{
      {"location", json{{"uri", rel_uri}, {"range", range_to_json(rel.range)}}},
      {"message", rel.message},
    });
  }
  item["relatedInformation"] = std::move(related);
  return item;
}

json workspace_edit_to_json(const WorkspaceEdit & edit)
{
  json changes = json::object();
  for (const auto & [uri, edits] : edit.changes) {
    json list = json::array();
    for (const auto & e : edits) {
      list.push_back(json{{"range", range_to_json(e.range)}, {"newText", e.new_text}});
    }
    changes[uri] = std::move(list);
  }
  return json{{"changes", std::move(changes)}};
}

json highlight_to_json(const DocumentHighlight & highlight)
{
  return json{
    {"range", range_to_json(highlight.range)},
    {"kind", static_cast<int>(highlight.kind)},
  };
}

json hover_to_json(const Hover & hover)
{
  return json{
    {"contents", {{"kind", "markdown"}, {"value", hover.contents}}},
    {"range", range_to_json(hover.range)},
  };
}

json document_symbol_to_json(const DocumentSymbol & symbol)
{
  json children = json::array();
  for (const auto & child : symbol.children) {
    children.push_back(document_symbol_to_json(child));
  }

  return json{
    {"name", symbol.name},
    {"detail", symbol.detail},
    {"kind", to_lsp_symbol_kind(symbol.kind)},
    {"range", range_to_json(symbol.range)},
    {"selectionRange", range_to_json(symbol.selection_range)},
    {"children", std::move(children)},
  };
}

json symbol_information_to_json(const SymbolInformation & info)
{
  return json{
    {"name", info.name},
    {"kind", to_lsp_symbol_kind(info.kind)},
    {"location", location_to_json(info.location)},
  };
}

}  // namespace frugal_ls::lsp
