// frugal_ls/sema/checks/duplicate_definition_checker.hpp - Duplicate top-level definitions
//
// Two definitions clash when they share both kind and name; a struct and an
// enum called `Status` do not clash.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <string>
#include <string_view>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/sema/symbol.hpp"

namespace frugal_ls
{

class DuplicateDefinitionChecker
{
public:
  explicit DuplicateDefinitionChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Report every repeat of a (kind, name) pair, pointing back at the first
   * occurrence. `n` definitions sharing a key produce `n - 1` errors.
   *
   * @param uri Document URI used for the related location
   * @return true if no duplicates were found
   */
  bool check(gsl::span<const Symbol> symbols, std::string_view uri);

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  void report_duplicate(const Symbol & dup, const Symbol & first, std::string_view uri);

  DiagnosticBag * diags_ = nullptr;
  bool hasErrors_ = false;
  size_t errorCount_ = 0;
};

}  // namespace frugal_ls
