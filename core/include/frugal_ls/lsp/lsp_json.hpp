// frugal_ls/lsp/lsp_json.hpp - LSP-shaped JSON for feature results
#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

#include "frugal_ls/basic/diagnostic.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"

namespace frugal_ls::lsp
{

using json = nlohmann::json;

/// LSP DiagnosticSeverity: Error=1, Warning=2, Information=3, Hint=4
[[nodiscard]] int to_lsp_severity(Severity severity) noexcept;

[[nodiscard]] json position_to_json(const Position & pos);
[[nodiscard]] json range_to_json(const Range & range);
[[nodiscard]] json location_to_json(const Location & loc);

/// `{range, severity, source, message, code?, relatedInformation[]}`
[[nodiscard]] json diagnostic_to_json(const Diagnostic & diag, std::string_view uri);

/// `{"changes": {uri: [{range, newText}]}}`
[[nodiscard]] json workspace_edit_to_json(const WorkspaceEdit & edit);

[[nodiscard]] json highlight_to_json(const DocumentHighlight & highlight);

/// `{"contents": {"kind": "markdown", "value"}, "range"}`
[[nodiscard]] json hover_to_json(const Hover & hover);
[[nodiscard]] json document_symbol_to_json(const DocumentSymbol & symbol);
[[nodiscard]] json symbol_information_to_json(const SymbolInformation & info);

}  // namespace frugal_ls::lsp
