// frugal_ls/sema/symbol_extractor.hpp - Symbol table extraction from a CST
#pragma once

#include <vector>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/sema/symbol.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

/**
 * Collect the top-level definitions (service, scope, struct, enum, const,
 * typedef, exception) below `root` in pre-order.
 *
 * Definitions without a name identifier are skipped. The result depends only
 * on the tree and the source, so repeated calls yield identical lists.
 */
[[nodiscard]] std::vector<Symbol> extract_symbols(ts_ll::Node root, const SourceManager & sm);

/**
 * Collect the members declared directly inside a top-level symbol: fields of
 * a struct/exception, methods of a service, values of an enum, operations of
 * a scope. Other kinds have no members.
 */
[[nodiscard]] std::vector<Symbol> extract_members(const Symbol & parent, const SourceManager & sm);

}  // namespace frugal_ls
