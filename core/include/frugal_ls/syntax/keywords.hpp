// frugal_ls/syntax/keywords.hpp - Reserved words and builtin type names
#pragma once

#include <array>
#include <string_view>

namespace frugal_ls::syntax
{

// NOTE: These are language surface keywords. Keep them aligned with
// tree-sitter-frugal/grammar.js.

inline constexpr std::array<std::string_view, 17> k_reserved_keywords = {
  "include", "cpp_include", "namespace", "service",  "scope",    "struct",
  "enum",    "exception",   "const",     "typedef",  "throws",   "extends",
  "oneway",  "required",    "optional",  "prefix",   "void",
};

// Builtin type names, including the container constructors.
inline constexpr std::array<std::string_view, 13> k_builtin_types = {
  "bool", "byte",   "i8",     "i16",  "i32", "i64", "double",
  "string", "binary", "uuid", "list", "set", "map",
};

[[nodiscard]] constexpr bool is_reserved_keyword(std::string_view word) noexcept
{
  for (const auto kw : k_reserved_keywords) {
    if (kw == word) return true;
  }
  return false;
}

[[nodiscard]] constexpr bool is_builtin_type(std::string_view word) noexcept
{
  for (const auto t : k_builtin_types) {
    if (t == word) return true;
  }
  return false;
}

}  // namespace frugal_ls::syntax
