// frugal_ls/document/document.cpp
#include "frugal_ls/document/document.hpp"

#include <utility>

#include "frugal_ls/sema/symbol_extractor.hpp"

namespace frugal_ls
{

const std::vector<std::string> & default_file_extensions()
{
  static const std::vector<std::string> k_extensions = {".frugal"};
  return k_extensions;
}

bool is_frugal_file(std::string_view uri, gsl::span<const std::string> extensions)
{
  for (const auto & ext : extensions) {
    if (ext.empty() || uri.size() < ext.size()) continue;
    if (uri.substr(uri.size() - ext.size()) == ext) return true;
  }
  return false;
}

Document Document::parse(std::string uri, std::string text, const ParseOptions & options)
{
  ParseResult parsed = parse_source(text, options);
  return Document(std::move(uri), std::move(text), std::move(parsed.tree), std::move(parsed.errors));
}

Document::Document(
  std::string uri, std::string text, ts_ll::Tree tree, std::vector<SyntaxError> syntax_errors)
: uri_(std::move(uri)),
  source_(std::move(text)),
  tree_(std::move(tree)),
  syntax_errors_(std::move(syntax_errors))
{
}

bool Document::is_analyzable() const { return is_analyzable(default_file_extensions()); }

bool Document::is_analyzable(gsl::span<const std::string> extensions) const
{
  return is_frugal_file(uri_, extensions);
}

std::vector<Symbol> Document::symbols() const
{
  if (!has_tree()) return {};
  return extract_symbols(root(), source_);
}

}  // namespace frugal_ls
