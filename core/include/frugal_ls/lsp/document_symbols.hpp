// frugal_ls/lsp/document_symbols.hpp - Outline and workspace symbol search
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"

namespace frugal_ls::lsp
{

/// Detail text shown next to a symbol in an outline ("Struct", "Scope (pub/sub)", ...)
[[nodiscard]] std::string_view symbol_detail(SymbolKind kind) noexcept;

/**
 * Hierarchical outline of one document.
 *
 * One entry per top-level definition in source order. Fields of structs and
 * exceptions, service methods, enum values and scope operations appear as
 * children.
 */
[[nodiscard]] std::vector<DocumentSymbol> document_symbols(const Document & doc);

/**
 * Top-level symbols of every analyzable document in `docs` whose name
 * contains `query`, ignoring ASCII case. An empty query matches everything.
 */
[[nodiscard]] std::vector<SymbolInformation> workspace_symbols(
  std::string_view query, const DocumentSet & docs, gsl::span<const std::string> extensions);

}  // namespace frugal_ls::lsp
