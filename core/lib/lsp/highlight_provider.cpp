// frugal_ls/lsp/highlight_provider.cpp
#include "frugal_ls/lsp/highlight_provider.hpp"

#include "frugal_ls/lsp/reference_finder.hpp"
#include "frugal_ls/sema/identifier_classifier.hpp"

namespace frugal_ls::lsp
{

namespace
{

DocumentHighlightKind highlight_kind(IdentifierRole role)
{
  switch (role) {
    case IdentifierRole::Declaration:
      return DocumentHighlightKind::Write;
    case IdentifierRole::TypeReference:
    case IdentifierRole::Reference:
      return DocumentHighlightKind::Read;
    case IdentifierRole::Unknown:
      break;
  }
  return DocumentHighlightKind::Text;
}

}  // namespace

std::vector<DocumentHighlight> HighlightProvider::highlights(
  const Document & doc, Position pos) const
{
  std::vector<DocumentHighlight> out;

  const auto symbol = ReferenceFinder::symbol_at(doc, pos);
  if (!symbol) return out;

  for (const ts_ll::Node id : ReferenceFinder::find_identifiers(doc, symbol->name)) {
    out.push_back(
      DocumentHighlight{id.position_range(), highlight_kind(classify_identifier(id).role)});
  }
  return out;
}

}  // namespace frugal_ls::lsp
