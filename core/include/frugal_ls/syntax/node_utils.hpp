// frugal_ls/syntax/node_utils.hpp - Tree walking and lookup helpers over ts_ll::Node
#pragma once

#include <cstdint>
#include <string_view>

#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls::syntax
{

/**
 * Visit `root` and every descendant (named and anonymous) in pre-order.
 *
 * Uses a tree cursor, so arbitrarily deep trees do not recurse.
 */
template <typename Fn>
void walk_preorder(ts_ll::Node root, Fn && fn)
{
  if (root.is_null()) return;

  ts_ll::Cursor cursor(root);
  for (;;) {
    fn(cursor.current_node());
    if (cursor.goto_first_child()) continue;
    while (!cursor.goto_next_sibling()) {
      if (!cursor.goto_parent()) return;
    }
  }
}

/// First direct child of the given kind, or a null node.
[[nodiscard]] ts_ll::Node first_child_of_kind(ts_ll::Node n, std::string_view kind);

/// First descendant (pre-order, excluding `n`) of the given kind, or a null node.
[[nodiscard]] ts_ll::Node first_descendant_of_kind(ts_ll::Node n, std::string_view kind);

/**
 * Name token of a definition-like node.
 *
 * The first direct `identifier` child; when there is none, the first
 * `identifier` descendant. Null when the node carries no identifier at all
 * (e.g. a definition cut short by a syntax error).
 */
[[nodiscard]] ts_ll::Node definition_name(ts_ll::Node definition);

/// True for the seven top-level definition kinds that produce symbols.
[[nodiscard]] bool is_top_level_definition(std::string_view kind) noexcept;

/// Top-level kinds plus function definitions.
[[nodiscard]] bool is_definition_kind(std::string_view kind) noexcept;

/// Deepest node (named or not) whose byte span contains `offset`.
[[nodiscard]] ts_ll::Node deepest_node_at(ts_ll::Node root, uint32_t offset);

}  // namespace frugal_ls::syntax
