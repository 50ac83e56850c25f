// frugal_ls/lsp/reference_finder.cpp
#include "frugal_ls/lsp/reference_finder.hpp"

#include <spdlog/spdlog.h>

#include <set>

#include "frugal_ls/sema/identifier_classifier.hpp"
#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls::lsp
{

namespace
{

namespace k = syntax::kind;

bool is_symbol_node(ts_ll::Node n)
{
  const std::string_view kind = n.kind();
  return kind == k::k_identifier || kind == k::k_base_type;
}

ts_ll::Node symbol_node_near(ts_ll::Node n)
{
  if (n.is_null()) return {};
  if (is_symbol_node(n)) return n;

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node c = n.child(i);
    if (is_symbol_node(c)) return c;
  }

  const ts_ll::Node parent = n.parent();
  if (!parent.is_null() && is_symbol_node(parent)) return parent;

  return {};
}

ts_ll::Node symbol_node_at_offset(ts_ll::Node root, uint32_t offset)
{
  return symbol_node_near(syntax::deepest_node_at(root, offset));
}

}  // namespace

std::optional<SymbolAtPosition> ReferenceFinder::symbol_at(const Document & doc, Position pos)
{
  if (!doc.has_tree()) return std::nullopt;

  const auto offset = doc.source().offset_at(pos);
  if (!offset) return std::nullopt;

  const ts_ll::Node root = doc.root();
  ts_ll::Node hit = symbol_node_at_offset(root, *offset);

  // Cursor just past the last character of a word
  if (hit.is_null() && *offset > 0) {
    const ts_ll::Node before = symbol_node_at_offset(root, *offset - 1);
    if (!before.is_null() && before.end_byte() == *offset) {
      hit = before;
    }
  }

  if (hit.is_null()) return std::nullopt;

  const std::string_view text = hit.text(doc.source());
  if (text.empty()) return std::nullopt;

  return SymbolAtPosition{std::string(text), hit.position_range(), hit};
}

std::vector<ts_ll::Node> ReferenceFinder::find_identifiers(
  const Document & doc, std::string_view name)
{
  std::vector<ts_ll::Node> out;
  if (!doc.has_tree() || name.empty()) return out;

  syntax::walk_preorder(doc.root(), [&](ts_ll::Node n) {
    if (n.kind() == k::k_identifier && n.text(doc.source()) == name) {
      out.push_back(n);
    }
  });
  return out;
}

std::vector<Location> ReferenceFinder::find_references(
  const Document & doc, Position pos, bool include_declaration, const DocumentSet & docs) const
{
  std::vector<Location> out;

  const auto symbol = symbol_at(doc, pos);
  if (!symbol) return out;

  const bool origin_is_declaration = classify_identifier(symbol->node).is_declaration();

  std::set<Location> seen;

  auto scan = [&](const Document & d) {
    if (!d.has_tree()) {
      spdlog::debug("references: skipping {} (no syntax tree)", d.uri());
      return;
    }

    for (const ts_ll::Node id : find_identifiers(d, symbol->name)) {
      Location loc{d.uri(), id.position_range()};
      if (!seen.insert(loc).second) continue;

      if (!include_declaration) {
        if (origin_is_declaration) {
          if (d.uri() == doc.uri() && loc.range == symbol->range) continue;
        } else if (classify_identifier(id).is_declaration()) {
          continue;
        }
      }

      out.push_back(std::move(loc));
    }
  };

  scan(doc);
  for (const auto & [uri, other] : docs) {
    if (other == nullptr || uri == doc.uri()) continue;
    scan(*other);
  }

  return out;
}

}  // namespace frugal_ls::lsp
