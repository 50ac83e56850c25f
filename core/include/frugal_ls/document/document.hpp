// frugal_ls/document/document.hpp - Parsed document snapshot
#pragma once

#include <functional>
#include <gsl/span>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/sema/symbol.hpp"
#include "frugal_ls/syntax/frontend.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

/// Extensions treated as Frugal sources when no configuration says otherwise
[[nodiscard]] const std::vector<std::string> & default_file_extensions();

/// True when the path or URI ends with one of `extensions`
[[nodiscard]] bool is_frugal_file(std::string_view uri, gsl::span<const std::string> extensions);

/**
 * One document as the language features see it: URI, source text, the
 * (possibly absent) syntax tree and the syntax errors found while parsing.
 *
 * Nothing derived from the tree is cached; symbols() re-extracts on every call.
 */
class Document
{
public:
  /**
   * Parse `text` and wrap the result.
   *
   * @throws std::runtime_error if the tree-sitter parser cannot be created
   */
  [[nodiscard]] static Document parse(
    std::string uri, std::string text, const ParseOptions & options = {});

  /// Wrap an already parsed (or absent) tree.
  Document(
    std::string uri, std::string text, ts_ll::Tree tree = ts_ll::Tree{},
    std::vector<SyntaxError> syntax_errors = {});

  Document(Document &&) noexcept = default;
  Document & operator=(Document &&) noexcept = default;

  [[nodiscard]] const std::string & uri() const noexcept { return uri_; }
  [[nodiscard]] const SourceManager & source() const noexcept { return source_; }
  [[nodiscard]] std::string_view text() const noexcept { return source_.get_source(); }

  [[nodiscard]] bool has_tree() const noexcept { return !tree_.is_null(); }
  /// Root of the syntax tree; a null node when there is no tree
  [[nodiscard]] ts_ll::Node root() const noexcept { return tree_.root_node(); }

  [[nodiscard]] const std::vector<SyntaxError> & syntax_errors() const noexcept
  {
    return syntax_errors_;
  }

  [[nodiscard]] bool is_analyzable() const;
  [[nodiscard]] bool is_analyzable(gsl::span<const std::string> extensions) const;

  /// Top-level symbols, freshly extracted
  [[nodiscard]] std::vector<Symbol> symbols() const;

private:
  std::string uri_;
  SourceManager source_;
  ts_ll::Tree tree_;
  std::vector<SyntaxError> syntax_errors_;
};

/// Snapshot of the open documents keyed by URI, iterated in URI order.
using DocumentSet = std::map<std::string, const Document *, std::less<>>;

}  // namespace frugal_ls
