// frugal_ls/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/basic/source_manager.hpp"

namespace frugal_ls
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: Duplicate struct definition 'User'
 *     --> idl/user.frugal:5:8
 *      |
 *    5 | struct User {
 *      |        ^^^^
 *      |
 *    1 | struct User {
 *      |        ---- First definition of 'User' here
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param source Source of the document the diagnostic belongs to
   * @param filename Name shown in the location line
   * @param uri Document URI; related locations in other documents are
   *            printed as notes without a source snippet
   */
  void print(
    const Diagnostic & diag, const SourceManager & source, std::string_view filename,
    std::string_view uri = {});

  /**
   * Print all diagnostics ordered by start position.
   */
  void print_all(
    const std::vector<Diagnostic> & diags, const SourceManager & source,
    std::string_view filename, std::string_view uri = {});

private:
  enum class MarkerStyle { Primary, Secondary };

  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceManager & source, const Range & range, MarkerStyle style,
    std::string_view label_message);

  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace frugal_ls
