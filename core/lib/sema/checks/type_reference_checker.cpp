// frugal_ls/sema/checks/type_reference_checker.cpp
#include "frugal_ls/sema/checks/type_reference_checker.hpp"

#include <fmt/format.h>

#include "frugal_ls/syntax/keywords.hpp"
#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls
{

namespace k = syntax::kind;

std::set<std::string, std::less<>> TypeReferenceChecker::known_types(
  gsl::span<const Symbol> symbols)
{
  std::set<std::string, std::less<>> known;
  known.emplace("void");
  for (const auto t : syntax::k_builtin_types) {
    known.emplace(t);
  }
  for (const auto & sym : symbols) {
    if (is_type_symbol(sym.kind)) {
      known.insert(sym.name);
    }
  }
  return known;
}

bool TypeReferenceChecker::check(
  ts_ll::Node root, const SourceManager & sm, gsl::span<const Symbol> symbols)
{
  errorCount_ = 0;
  const auto known = known_types(symbols);

  syntax::walk_preorder(root, [&](ts_ll::Node n) {
    if (n.kind() != k::k_field_type) return;

    // Only a bare identifier can be unresolved; base types are builtin,
    // containers recurse into their own field_type nodes.
    const ts_ll::Node name = syntax::first_child_of_kind(n, k::k_identifier);
    if (name.is_null()) return;

    const std::string_view type_name = name.text(sm);
    if (type_name.empty() || known.find(type_name) != known.end()) return;

    ++errorCount_;
    if (diags_ != nullptr) {
      diags_->report_error(n.position_range(), fmt::format("Unknown type '{}'", type_name))
        .with_code(diag_code::k_unknown_type);
    }
  });

  return errorCount_ == 0;
}

}  // namespace frugal_ls
