// frugal_ls/sema/checks/naming_convention_checker.hpp - Naming style warnings
#pragma once

#include <cstddef>
#include <gsl/span>
#include <string_view>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/sema/symbol.hpp"

namespace frugal_ls
{

/**
 * First character uppercase ASCII, no '_' or space, and at least one
 * lowercase letter somewhere (so all-caps names are rejected).
 */
[[nodiscard]] bool is_pascal_case(std::string_view name) noexcept;

/**
 * Only uppercase ASCII letters, digits and underscores; an underscore may
 * not lead, trail, or follow another underscore.
 */
[[nodiscard]] bool is_upper_snake_case(std::string_view name) noexcept;

/**
 * Services, structs, enums, exceptions and scopes must be PascalCase;
 * consts must be UPPER_SNAKE_CASE. Typedefs are not checked. Violations are
 * warnings.
 */
class NamingConventionChecker
{
public:
  explicit NamingConventionChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /// @return true if every checked name follows its convention
  bool check(gsl::span<const Symbol> symbols);

  [[nodiscard]] bool has_warnings() const noexcept { return warningCount_ > 0; }
  [[nodiscard]] size_t warning_count() const noexcept { return warningCount_; }

private:
  void report_violation(const Symbol & sym, std::string_view convention);

  DiagnosticBag * diags_ = nullptr;
  size_t warningCount_ = 0;
};

}  // namespace frugal_ls
