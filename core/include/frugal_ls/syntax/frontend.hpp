// frugal_ls/syntax/frontend.hpp - Parse pipeline (source text -> CST + syntax errors)
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

/// One ERROR or MISSING node found in a recovered tree.
struct SyntaxError
{
  Position position;  ///< 0-based start of the offending node
  std::string message;  ///< "Syntax error" or "Missing <kind>"
};

struct ParseOptions
{
  /// Stop collecting syntax errors after this many (0 = no limit).
  size_t max_syntax_errors = 0;
};

struct ParseResult
{
  /// Null only if tree-sitter itself gave up (never for valid UTF-8 input)
  ts_ll::Tree tree;
  std::vector<SyntaxError> errors;

  [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
};

/**
 * Parse Frugal source text.
 *
 * Tree-sitter always recovers; every ERROR/MISSING node of the resulting tree
 * is reported in ParseResult::errors in document order.
 *
 * @throws std::runtime_error if the tree-sitter parser cannot be created
 */
[[nodiscard]] ParseResult parse_source(std::string_view source, const ParseOptions & options = {});

}  // namespace frugal_ls
