// frugal_ls/sema/checks/field_id_checker.cpp
#include "frugal_ls/sema/checks/field_id_checker.hpp"

#include <fmt/format.h>

#include <charconv>
#include <map>
#include <string>

#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls
{

namespace
{

namespace k = syntax::kind;

std::string_view duplicate_suffix(FieldIdNamespace ns)
{
  switch (ns) {
    case FieldIdNamespace::Parameters:
      return " in parameter list";
    case FieldIdNamespace::Throws:
      return " in throws list";
    case FieldIdNamespace::Struct:
      break;
  }
  return "";
}

}  // namespace

std::optional<int64_t> FieldIdChecker::parse_field_id(std::string_view text) noexcept
{
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') return std::nullopt;
  }
  if (text.empty()) return std::nullopt;

  int64_t value = 0;
  const char * first = text.data();
  const char * last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, 10);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return value;
}

FieldIdNamespace FieldIdChecker::function_list_namespace(ts_ll::Node field_list)
{
  const ts_ll::Node fn = field_list.parent();
  if (fn.is_null() || fn.kind() != k::k_function_definition) {
    return FieldIdNamespace::Parameters;
  }

  for (uint32_t i = 0; i < fn.child_count(); ++i) {
    const ts_ll::Node c = fn.child(i);
    if (c == field_list) break;
    if (c.kind() == k::k_throws) return FieldIdNamespace::Throws;
  }
  return FieldIdNamespace::Parameters;
}

bool FieldIdChecker::check(ts_ll::Node root, const SourceManager & sm, std::string_view uri)
{
  hasErrors_ = false;
  errorCount_ = 0;

  syntax::walk_preorder(root, [&](ts_ll::Node n) {
    const std::string_view kind = n.kind();
    if (kind == k::k_struct_definition || kind == k::k_exception_definition) {
      check_namespace(
        syntax::first_child_of_kind(n, k::k_struct_body), FieldIdNamespace::Struct, sm, uri);
    } else if (kind == k::k_function_definition) {
      for (uint32_t i = 0; i < n.child_count(); ++i) {
        const ts_ll::Node c = n.child(i);
        if (c.kind() != k::k_field_list) continue;
        check_namespace(c, function_list_namespace(c), sm, uri);
      }
    }
  });

  return !hasErrors_;
}

void FieldIdChecker::check_namespace(
  ts_ll::Node container, FieldIdNamespace ns, const SourceManager & sm, std::string_view uri)
{
  if (container.is_null()) return;

  std::map<int64_t, ts_ll::Node> first_use;

  for (uint32_t i = 0; i < container.child_count(); ++i) {
    const ts_ll::Node field = container.child(i);
    if (field.kind() != k::k_field) continue;

    const ts_ll::Node id_node = syntax::first_child_of_kind(field, k::k_field_id);
    const ts_ll::Node int_node = syntax::first_child_of_kind(id_node, k::k_integer);
    if (int_node.is_null()) continue;

    const auto id = parse_field_id(int_node.text(sm));
    if (!id) continue;

    const auto [it, inserted] = first_use.try_emplace(*id, int_node);
    if (!inserted) {
      hasErrors_ = true;
      ++errorCount_;
      if (diags_ != nullptr) {
        diags_
          ->report_error(
            int_node.position_range(),
            fmt::format("Duplicate field ID {}{}", *id, duplicate_suffix(ns)))
          .with_code(diag_code::k_duplicate_field_id)
          .with_related(
            std::string(uri), it->second.position_range(),
            fmt::format("Field ID {} first used here", *id));
      }
    }

    if (!is_valid_field_id(*id)) {
      hasErrors_ = true;
      ++errorCount_;
      if (diags_ != nullptr) {
        diags_
          ->report_error(
            int_node.position_range(), fmt::format("Field ID must be positive, got {}", *id))
          .with_code(diag_code::k_non_positive_field_id);
      }
    }
  }
}

}  // namespace frugal_ls
