// frugal_ls/lsp/hover_provider.hpp - Markdown hover for symbols, types and keywords
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"

namespace frugal_ls::lsp
{

class HoverProvider
{
public:
  HoverProvider();
  explicit HoverProvider(std::vector<std::string> extensions);

  /**
   * Describe the token under `pos`.
   *
   * An identifier naming a top-level definition gets the definition kind,
   * a one-line summary, its members (fields, methods, enum values, scope
   * operations) or its declared value, and where it is defined. The origin
   * document is searched first, then the other analyzable documents of
   * `docs`. Builtin type names and keywords get a fixed description.
   *
   * Returns std::nullopt when nothing describable is under the cursor.
   */
  [[nodiscard]] std::optional<Hover> hover(
    const Document & doc, Position pos, const DocumentSet & docs) const;

  /// Description of a builtin type (`void` included); empty for anything else.
  [[nodiscard]] static std::string_view builtin_type_description(std::string_view name) noexcept;

  /// Markdown description of a keyword; empty for anything else.
  [[nodiscard]] static std::string_view keyword_description(std::string_view word) noexcept;

private:
  std::vector<std::string> extensions_;
};

}  // namespace frugal_ls::lsp
