// frugal_ls/lsp/definition_provider.hpp - Go-to-definition across documents
#pragma once

#include <string>
#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"

namespace frugal_ls::lsp
{

class DefinitionProvider
{
public:
  DefinitionProvider();
  explicit DefinitionProvider(std::vector<std::string> extensions);

  /**
   * Locate the top-level definitions named like the identifier under `pos`.
   *
   * The origin document is searched first, then every other document of
   * `docs` whose URI carries one of the configured extensions. Only symbol
   * names are compared; members (fields, methods, enum values) are not
   * definition targets.
   */
  [[nodiscard]] std::vector<Location> definition(
    const Document & doc, Position pos, const DocumentSet & docs) const;

private:
  std::vector<std::string> extensions_;
};

}  // namespace frugal_ls::lsp
