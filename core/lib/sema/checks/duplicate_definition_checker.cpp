// frugal_ls/sema/checks/duplicate_definition_checker.cpp
#include "frugal_ls/sema/checks/duplicate_definition_checker.hpp"

#include <fmt/format.h>

#include <map>
#include <utility>

namespace frugal_ls
{

bool DuplicateDefinitionChecker::check(gsl::span<const Symbol> symbols, std::string_view uri)
{
  hasErrors_ = false;
  errorCount_ = 0;

  std::map<std::pair<SymbolKind, std::string_view>, const Symbol *> first_seen;

  for (const auto & sym : symbols) {
    if (sym.name.empty()) continue;

    const auto [it, inserted] = first_seen.try_emplace({sym.kind, sym.name}, &sym);
    if (!inserted) {
      report_duplicate(sym, *it->second, uri);
    }
  }

  return !hasErrors_;
}

void DuplicateDefinitionChecker::report_duplicate(
  const Symbol & dup, const Symbol & first, std::string_view uri)
{
  hasErrors_ = true;
  ++errorCount_;
  if (diags_ == nullptr) return;

  diags_
    ->report_error(
      dup.declaration_range,
      fmt::format("Duplicate {} definition '{}'", to_string(dup.kind), dup.name))
    .with_code(diag_code::k_duplicate_definition)
    .with_related(
      std::string(uri), first.declaration_range,
      fmt::format("First definition of '{}' here", first.name));
}

}  // namespace frugal_ls
