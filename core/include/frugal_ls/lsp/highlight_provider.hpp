// frugal_ls/lsp/highlight_provider.hpp - Same-document occurrence highlighting
#pragma once

#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"

namespace frugal_ls::lsp
{

class HighlightProvider
{
public:
  /**
   * Highlight every occurrence of the symbol under `pos` in `doc` only.
   *
   * Declarations are marked Write, other uses Read. Occurrences the
   * classifier cannot place are marked Text.
   */
  [[nodiscard]] std::vector<DocumentHighlight> highlights(const Document & doc, Position pos) const;
};

}  // namespace frugal_ls::lsp
