// frugal_ls/sema/checks/naming_convention_checker.cpp
#include "frugal_ls/sema/checks/naming_convention_checker.hpp"

#include <fmt/format.h>

namespace frugal_ls
{

namespace
{

constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

bool is_pascal_case(std::string_view name) noexcept
{
  if (name.empty() || !is_upper(name.front())) return false;

  bool has_lower = false;
  for (const char c : name) {
    if (c == '_' || c == ' ') return false;
    if (is_lower(c)) has_lower = true;
  }
  return has_lower;
}

bool is_upper_snake_case(std::string_view name) noexcept
{
  if (name.empty()) return false;

  bool prev_underscore = false;
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (is_upper(c) || is_digit(c)) {
      prev_underscore = false;
      continue;
    }
    if (c == '_') {
      if (i == 0 || i + 1 == name.size() || prev_underscore) return false;
      prev_underscore = true;
      continue;
    }
    return false;
  }
  return true;
}

bool NamingConventionChecker::check(gsl::span<const Symbol> symbols)
{
  warningCount_ = 0;

  for (const auto & sym : symbols) {
    switch (sym.kind) {
      case SymbolKind::Service:
      case SymbolKind::Struct:
      case SymbolKind::Exception:
      case SymbolKind::Enum:
      case SymbolKind::Scope:
        if (!is_pascal_case(sym.name)) report_violation(sym, "PascalCase");
        break;
      case SymbolKind::Const:
        if (!is_upper_snake_case(sym.name)) report_violation(sym, "UPPER_SNAKE_CASE");
        break;
      default:
        break;
    }
  }

  return warningCount_ == 0;
}

void NamingConventionChecker::report_violation(const Symbol & sym, std::string_view convention)
{
  ++warningCount_;
  if (diags_ == nullptr) return;

  diags_
    ->report_warning(
      sym.declaration_range, fmt::format(
                               "{} '{}' should follow {} naming convention",
                               display_name(sym.kind), sym.name, convention))
    .with_code(diag_code::k_naming_convention);
}

}  // namespace frugal_ls
