// frugal_ls/lsp/rename_provider.cpp
#include "frugal_ls/lsp/rename_provider.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "frugal_ls/syntax/keywords.hpp"

namespace frugal_ls::lsp
{

namespace
{

bool is_ascii_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_ident_start(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; }

bool is_ident_char(char c) { return is_ident_start(c) || (c >= '0' && c <= '9'); }

}  // namespace

NameCheck RenameProvider::validate_new_name(std::string_view name)
{
  if (std::all_of(name.begin(), name.end(), is_ascii_space)) {
    return NameCheck::fail("new name cannot be empty");
  }

  if (!is_ident_start(name.front()) || !std::all_of(name.begin(), name.end(), is_ident_char)) {
    return NameCheck::fail(fmt::format("'{}' is not a valid identifier", name));
  }

  if (syntax::is_reserved_keyword(name) || syntax::is_builtin_type(name)) {
    return NameCheck::fail(
      fmt::format("'{}' is a reserved keyword and cannot be used as an identifier", name));
  }

  return NameCheck::ok();
}

bool RenameProvider::is_renameable(std::string_view name) noexcept
{
  return !name.empty() && !syntax::is_builtin_type(name) && !syntax::is_reserved_keyword(name);
}

PrepareRenameResult RenameProvider::prepare_rename(const Document & doc, Position pos) const
{
  const auto symbol = ReferenceFinder::symbol_at(doc, pos);
  if (!symbol) {
    return PrepareRenameResult::fail("no renameable symbol found at position");
  }
  if (!is_renameable(symbol->name)) {
    return PrepareRenameResult::fail(fmt::format("symbol {} cannot be renamed", symbol->name));
  }
  return PrepareRenameResult::ok(symbol->range, symbol->name);
}

RenameResult RenameProvider::rename(
  const Document & doc, Position pos, std::string_view new_name, const DocumentSet & docs) const
{
  const auto symbol = ReferenceFinder::symbol_at(doc, pos);
  if (!symbol) {
    return RenameResult::fail("no renameable symbol found at position");
  }

  if (!is_renameable(symbol->name)) {
    return RenameResult::fail(fmt::format("symbol {} cannot be renamed", symbol->name));
  }

  if (const NameCheck check = validate_new_name(new_name); !check.success) {
    spdlog::debug("rename of '{}' rejected: {}", symbol->name, check.error);
    return RenameResult::fail(check.error);
  }

  if (symbol->name == new_name) {
    return RenameResult::fail(
      fmt::format("new name '{}' is the same as current name", new_name));
  }

  WorkspaceEdit edit;
  for (auto & loc : references_.find_references(doc, pos, /*include_declaration*/ true, docs)) {
    edit.changes[loc.uri].push_back(TextEdit{loc.range, std::string(new_name)});
  }

  spdlog::debug(
    "rename '{}' -> '{}': {} edit(s) in {} document(s)", symbol->name, new_name,
    edit.edit_count(), edit.changes.size());
  return RenameResult::ok(std::move(edit));
}

}  // namespace frugal_ls::lsp
