// frugal_ls/syntax/node_kinds.hpp - tree-sitter-frugal node type names
#pragma once

#include <string_view>

namespace frugal_ls::syntax::kind
{

// NOTE: Keep aligned with tree-sitter-frugal/grammar.js.

inline constexpr std::string_view k_source_file = "source_file";

// Headers
inline constexpr std::string_view k_include_statement = "include_statement";
inline constexpr std::string_view k_namespace_statement = "namespace_statement";

// Top-level definitions
inline constexpr std::string_view k_service_definition = "service_definition";
inline constexpr std::string_view k_scope_definition = "scope_definition";
inline constexpr std::string_view k_struct_definition = "struct_definition";
inline constexpr std::string_view k_enum_definition = "enum_definition";
inline constexpr std::string_view k_const_definition = "const_definition";
inline constexpr std::string_view k_typedef_definition = "typedef_definition";
inline constexpr std::string_view k_exception_definition = "exception_definition";

// Members
inline constexpr std::string_view k_function_definition = "function_definition";
inline constexpr std::string_view k_scope_operation = "scope_operation";
inline constexpr std::string_view k_field = "field";
inline constexpr std::string_view k_field_list = "field_list";
inline constexpr std::string_view k_field_id = "field_id";
inline constexpr std::string_view k_enum_field = "enum_field";

// Bodies
inline constexpr std::string_view k_struct_body = "struct_body";
inline constexpr std::string_view k_service_body = "service_body";
inline constexpr std::string_view k_scope_body = "scope_body";
inline constexpr std::string_view k_enum_body = "enum_body";

// Types
inline constexpr std::string_view k_field_type = "field_type";
inline constexpr std::string_view k_base_type = "base_type";
inline constexpr std::string_view k_container_type = "container_type";
inline constexpr std::string_view k_return_type = "return_type";
inline constexpr std::string_view k_qualified_identifier = "qualified_identifier";
inline constexpr std::string_view k_service_extends = "service_extends";

// Values
inline constexpr std::string_view k_const_value = "const_value";

// Tokens
inline constexpr std::string_view k_identifier = "identifier";
inline constexpr std::string_view k_integer = "integer";
inline constexpr std::string_view k_literal_string = "literal_string";
inline constexpr std::string_view k_throws = "throws";
inline constexpr std::string_view k_comment = "comment";

}  // namespace frugal_ls::syntax::kind
