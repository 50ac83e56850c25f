// frugal_ls/syntax/node_utils.cpp - Tree walking and lookup helpers
#include "frugal_ls/syntax/node_utils.hpp"

#include "frugal_ls/syntax/node_kinds.hpp"

namespace frugal_ls::syntax
{

ts_ll::Node first_child_of_kind(ts_ll::Node n, std::string_view kind)
{
  if (n.is_null()) return {};
  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node c = n.child(i);
    if (c.kind() == kind) return c;
  }
  return {};
}

ts_ll::Node first_descendant_of_kind(ts_ll::Node n, std::string_view kind)
{
  ts_ll::Node found;
  if (n.is_null()) return found;

  for (uint32_t i = 0; i < n.child_count() && found.is_null(); ++i) {
    walk_preorder(n.child(i), [&](ts_ll::Node d) {
      if (found.is_null() && d.kind() == kind) found = d;
    });
  }
  return found;
}

ts_ll::Node definition_name(ts_ll::Node definition)
{
  if (const auto direct = first_child_of_kind(definition, kind::k_identifier); !direct.is_null()) {
    return direct;
  }
  return first_descendant_of_kind(definition, kind::k_identifier);
}

bool is_top_level_definition(std::string_view k) noexcept
{
  return k == kind::k_service_definition || k == kind::k_scope_definition ||
         k == kind::k_struct_definition || k == kind::k_enum_definition ||
         k == kind::k_const_definition || k == kind::k_typedef_definition ||
         k == kind::k_exception_definition;
}

bool is_definition_kind(std::string_view k) noexcept
{
  return is_top_level_definition(k) || k == kind::k_function_definition;
}

ts_ll::Node deepest_node_at(ts_ll::Node root, uint32_t offset)
{
  if (root.is_null() || offset < root.start_byte() || offset > root.end_byte()) {
    return {};
  }

  ts_ll::Node current = root;
  for (;;) {
    ts_ll::Node next;
    for (uint32_t i = 0; i < current.child_count(); ++i) {
      const ts_ll::Node c = current.child(i);
      if (offset >= c.start_byte() && offset < c.end_byte()) {
        next = c;
        break;
      }
    }
    if (next.is_null()) return current;
    current = next;
  }
}

}  // namespace frugal_ls::syntax
