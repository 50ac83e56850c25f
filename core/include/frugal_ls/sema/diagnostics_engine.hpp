// frugal_ls/sema/diagnostics_engine.hpp - Per-document diagnostics pipeline
//
// Runs a fixed sequence of independent passes and concatenates their output:
//   1. syntax errors from the parser
//   2. duplicate definitions
//   3. field identifiers
//   4. naming conventions   (optional)
//   5. unresolved types     (optional)
// A failing pass never suppresses a later one; semantic passes run on the
// recovered tree even when the parse had errors.
//
#pragma once

#include <cstddef>
#include <vector>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/document/document.hpp"

namespace frugal_ls
{

struct DiagnosticsOptions
{
  bool naming_conventions = true;
  bool type_references = true;
  /// Forward at most this many syntax errors (0 = all)
  size_t max_syntax_errors = 0;
};

class DiagnosticsEngine
{
public:
  DiagnosticsEngine() = default;
  explicit DiagnosticsEngine(DiagnosticsOptions options) : options_(options) {}

  [[nodiscard]] const DiagnosticsOptions & options() const noexcept { return options_; }

  /// All diagnostics for one document; empty when there is nothing to report.
  [[nodiscard]] std::vector<Diagnostic> run(const Document & doc) const;

private:
  DiagnosticsOptions options_;
};

}  // namespace frugal_ls
