// frugal_ls/lsp/definition_provider.cpp
#include "frugal_ls/lsp/definition_provider.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "frugal_ls/lsp/reference_finder.hpp"

namespace frugal_ls::lsp
{

DefinitionProvider::DefinitionProvider() : extensions_(default_file_extensions()) {}

DefinitionProvider::DefinitionProvider(std::vector<std::string> extensions)
: extensions_(std::move(extensions))
{
}

std::vector<Location> DefinitionProvider::definition(
  const Document & doc, Position pos, const DocumentSet & docs) const
{
  std::vector<Location> out;

  const auto symbol = ReferenceFinder::symbol_at(doc, pos);
  if (!symbol) return out;

  auto collect = [&](const Document & d) {
    for (const auto & sym : d.symbols()) {
      if (sym.name != symbol->name) continue;
      Location loc{d.uri(), sym.declaration_range};
      if (std::find(out.begin(), out.end(), loc) == out.end()) {
        out.push_back(std::move(loc));
      }
    }
  };

  collect(doc);
  for (const auto & [uri, other] : docs) {
    if (other == nullptr || uri == doc.uri()) continue;
    if (!other->is_analyzable(extensions_)) continue;
    collect(*other);
  }

  spdlog::debug("definition '{}': {} location(s)", symbol->name, out.size());
  return out;
}

}  // namespace frugal_ls::lsp
