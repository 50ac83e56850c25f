// frugal_ls/sema/checks/type_reference_checker.hpp - Unresolved type names
#pragma once

#include <cstddef>
#include <functional>
#include <gsl/span>
#include <set>
#include <string>
#include <string_view>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/sema/symbol.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

/**
 * Report field types that name neither a builtin nor a struct, exception,
 * enum or typedef of the same document.
 *
 * Container types are checked through their element types. Qualified names
 * (`common.User`) point into included files and are never reported.
 */
class TypeReferenceChecker
{
public:
  explicit TypeReferenceChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /// @return true if every type name resolved
  bool check(ts_ll::Node root, const SourceManager & sm, gsl::span<const Symbol> symbols);

  /// Builtin type names (including `void` and the container keywords)
  /// together with the document's user-defined type names.
  [[nodiscard]] static std::set<std::string, std::less<>> known_types(
    gsl::span<const Symbol> symbols);

  [[nodiscard]] bool has_errors() const noexcept { return errorCount_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  DiagnosticBag * diags_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace frugal_ls
