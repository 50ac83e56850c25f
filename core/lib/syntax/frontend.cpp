// frugal_ls/syntax/frontend.cpp - High-level parse pipeline
#include "frugal_ls/syntax/frontend.hpp"

#include <spdlog/spdlog.h>

namespace frugal_ls
{

namespace
{

bool reached_limit(const std::vector<SyntaxError> & errors, size_t limit)
{
  return limit != 0 && errors.size() >= limit;
}

void collect_syntax_errors(
  const ts_ll::Node n, std::vector<SyntaxError> & errors, size_t limit)
{
  if (n.is_null() || reached_limit(errors, limit)) return;

  if (n.is_error()) {
    errors.push_back(SyntaxError{n.start_position(), "Syntax error"});
  } else if (n.is_missing()) {
    errors.push_back(
      SyntaxError{n.start_position(), "Missing " + std::string(n.kind())});
  }

  // Subtrees without errors cannot contain ERROR/MISSING nodes
  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node c = n.child(i);
    if (!c.has_error()) continue;
    collect_syntax_errors(c, errors, limit);
    if (reached_limit(errors, limit)) return;
  }
}

}  // namespace

ParseResult parse_source(std::string_view source, const ParseOptions & options)
{
  ParseResult result;

  const ts_ll::Parser parser;
  result.tree.reset(parser.parse_string(source));

  if (result.tree.is_null()) {
    spdlog::warn("tree-sitter returned no tree for {} bytes of input", source.size());
    return result;
  }

  const ts_ll::Node root = result.tree.root_node();
  if (root.has_error()) {
    collect_syntax_errors(root, result.errors, options.max_syntax_errors);
    spdlog::debug("parse recovered with {} syntax error(s)", result.errors.size());
  }

  return result;
}

}  // namespace frugal_ls
