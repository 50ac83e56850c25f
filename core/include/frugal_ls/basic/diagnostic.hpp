// frugal_ls/basic/diagnostic.hpp - Diagnostic types for parsing/sema
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/basic/source_manager.hpp"

namespace frugal_ls
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Secondary location attached to a diagnostic (e.g. the first definition of
/// a duplicated name).
struct RelatedLocation
{
  std::string uri;
  Range range;
  std::string message;
};

/// Value of Diagnostic::source for everything this library reports
inline constexpr std::string_view k_diagnostic_source = "frugal-ls";

struct Diagnostic
{
  Severity severity = Severity::Error;
  Range range;
  std::string message;
  std::string source = std::string(k_diagnostic_source);
  std::string code;  // e.g., "E0101"

  std::vector<RelatedLocation> related;
};

// Diagnostic codes
namespace diag_code
{
inline constexpr std::string_view k_syntax_error = "E0001";
inline constexpr std::string_view k_missing_token = "E0002";
inline constexpr std::string_view k_duplicate_definition = "E0101";
inline constexpr std::string_view k_duplicate_field_id = "E0102";
inline constexpr std::string_view k_non_positive_field_id = "E0103";
inline constexpr std::string_view k_unknown_type = "E0201";
inline constexpr std::string_view k_naming_convention = "W0301";
}  // namespace diag_code

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the
 * bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_related(std::string uri, Range range, std::string msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(Range range, std::string message);
  DiagnosticBuilder report_warning(Range range, std::string message);

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  /// Move the collected diagnostics out, leaving the bag empty
  [[nodiscard]] std::vector<Diagnostic> take();

private:
  DiagnosticBuilder report(Severity severity, Range range, std::string message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace frugal_ls
