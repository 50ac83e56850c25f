// frugal_ls/lsp/reference_finder.hpp - Symbol lookup and cross-document references
//
// Matching is by exact identifier text. There is no lexical scoping: two
// unrelated fields named `id` are the same symbol as far as references,
// rename and highlight are concerned.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls::lsp
{

/// Identifier-bearing node found under a cursor.
struct SymbolAtPosition
{
  std::string name;
  Range range;
  ts_ll::Node node;  ///< `identifier` or `base_type`
};

class ReferenceFinder
{
public:
  /**
   * Resolve the identifier under `pos`.
   *
   * Looks at the deepest node containing the cursor, then its direct
   * children, then its parent. A cursor sitting right after an identifier
   * (e.g. at the end of a word) resolves to that identifier.
   *
   * Returns std::nullopt when the document has no tree, the position lies
   * outside the text, or nothing identifier-like is there.
   */
  [[nodiscard]] static std::optional<SymbolAtPosition> symbol_at(
    const Document & doc, Position pos);

  /// Every `identifier` node of `doc` whose text is `name`, in document order.
  [[nodiscard]] static std::vector<ts_ll::Node> find_identifiers(
    const Document & doc, std::string_view name);

  /**
   * Find all occurrences of the symbol under `pos`.
   *
   * The origin document is searched first, then every other document of
   * `docs` in URI order; documents without a tree are skipped. Locations are
   * unique by (uri, range).
   *
   * With `include_declaration == false` the declaration is left out: the
   * origin identifier itself when it is a declaration, otherwise every
   * occurrence that sits in a declaration position.
   */
  [[nodiscard]] std::vector<Location> find_references(
    const Document & doc, Position pos, bool include_declaration, const DocumentSet & docs) const;
};

}  // namespace frugal_ls::lsp
