// frugal_ls/lsp/lsp_types.hpp - Result types of the language features
//
// Shapes follow the Language Server Protocol so a host can serialize them
// directly; no transport is implemented here.
//
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/sema/symbol.hpp"

namespace frugal_ls::lsp
{

/// A range inside a document. Equality and ordering use (uri, range) exactly.
struct Location
{
  std::string uri;
  Range range;

  [[nodiscard]] bool operator==(const Location & o) const noexcept
  {
    return uri == o.uri && range == o.range;
  }
  [[nodiscard]] bool operator!=(const Location & o) const noexcept { return !(*this == o); }
  [[nodiscard]] bool operator<(const Location & o) const noexcept
  {
    return std::tie(uri, range) < std::tie(o.uri, o.range);
  }
};

struct TextEdit
{
  Range range;
  std::string new_text;
};

/// Edits grouped by document URI, each list in discovery order.
struct WorkspaceEdit
{
  std::map<std::string, std::vector<TextEdit>> changes;

  [[nodiscard]] size_t edit_count() const noexcept
  {
    size_t n = 0;
    for (const auto & [uri, edits] : changes) n += edits.size();
    return n;
  }
};

/// Values match LSP DocumentHighlightKind.
enum class DocumentHighlightKind : uint8_t {
  Text = 1,
  Read = 2,
  Write = 3,
};

struct DocumentHighlight
{
  Range range;
  DocumentHighlightKind kind = DocumentHighlightKind::Text;
};

/// Markdown hover text for the token at `range`.
struct Hover
{
  std::string contents;
  Range range;
};

/// Outline entry; members of a definition appear as children.
struct DocumentSymbol
{
  std::string name;
  std::string detail;
  SymbolKind kind = SymbolKind::Struct;
  Range range;            ///< whole definition
  Range selection_range;  ///< name token
  std::vector<DocumentSymbol> children;
};

/// Flat symbol entry for workspace-wide search.
struct SymbolInformation
{
  std::string name;
  SymbolKind kind = SymbolKind::Struct;
  Location location;
};

/// LSP SymbolKind value used when serializing `kind`.
[[nodiscard]] int to_lsp_symbol_kind(SymbolKind kind) noexcept;

}  // namespace frugal_ls::lsp
