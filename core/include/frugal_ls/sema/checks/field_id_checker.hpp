// frugal_ls/sema/checks/field_id_checker.hpp - Field identifier validation
//
// Field IDs live in namespaces: every struct/exception body is one, and every
// function owns two (its parameter list and its throws list). IDs must be
// unique within a namespace and positive everywhere.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/syntax/ts_ll.hpp"

namespace frugal_ls
{

enum class FieldIdNamespace : uint8_t {
  Struct,      ///< struct or exception body
  Parameters,  ///< function parameter list
  Throws,      ///< function throws list
};

class FieldIdChecker
{
public:
  explicit FieldIdChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Check every field-ID namespace below `root`.
   *
   * @return true if no duplicate or non-positive IDs were found
   */
  bool check(ts_ll::Node root, const SourceManager & sm, std::string_view uri);

  /**
   * Parse a field-ID token as a signed decimal integer.
   *
   * Returns std::nullopt for anything else (hex literals, overflow, stray
   * characters); such IDs take part in neither the duplicate nor the
   * positivity check.
   */
  [[nodiscard]] static std::optional<int64_t> parse_field_id(std::string_view text) noexcept;

  /// Field IDs must be >= 1.
  [[nodiscard]] static constexpr bool is_valid_field_id(int64_t id) noexcept { return id >= 1; }

  /// Which namespace a function's field_list belongs to
  [[nodiscard]] static FieldIdNamespace function_list_namespace(ts_ll::Node field_list);

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  void check_namespace(
    ts_ll::Node container, FieldIdNamespace ns, const SourceManager & sm, std::string_view uri);

  DiagnosticBag * diags_ = nullptr;
  bool hasErrors_ = false;
  size_t errorCount_ = 0;
};

}  // namespace frugal_ls
