// frugal_ls/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "frugal_ls/project/project_config.hpp"

namespace frugal_ls::lsp
{

/**
 * Serverless language service for Frugal IDL.
 *
 * Provides LSP-equivalent features (diagnostics, hover, references, rename,
 * highlight, definition, outline, workspace symbols) without implementing an
 * LSP server. A host owns the transport and forwards requests here; every
 * result is returned as a JSON string in LSP shape.
 *
 * Positions are 0-based lines and UTF-8 byte columns. Documents are parsed
 * when they are set; every request works on a snapshot of the documents
 * currently held. Not thread-safe.
 */
class Workspace
{
public:
  Workspace();
  explicit Workspace(ProjectConfig config);
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  /// Replace the configuration; held documents are re-parsed.
  void set_config(ProjectConfig config);
  [[nodiscard]] const ProjectConfig & config() const noexcept;

  /**
   * Add or replace a document.
   *
   * @throws std::runtime_error if the parser cannot be created
   */
  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  // Diagnostics: {"uri", "items": [...]}
  std::string diagnostics_json(std::string_view uri);

  // Hover: {"uri", "contents": {"kind", "value"} | null, "range": {...} | null}
  std::string hover_json(std::string_view uri, uint32_t line, uint32_t character);

  // Find references: {"locations": [...]}
  std::string references_json(
    std::string_view uri, uint32_t line, uint32_t character, bool include_declaration);

  // Go-to-definition: {"locations": [...]}
  std::string definition_json(std::string_view uri, uint32_t line, uint32_t character);

  // Rename: {"changes": {...}} or {"error": "..."}
  std::string rename_json(
    std::string_view uri, uint32_t line, uint32_t character, std::string_view new_name);
  // {"range", "placeholder"} or {"error": "..."}
  std::string prepare_rename_json(std::string_view uri, uint32_t line, uint32_t character);

  // Document highlights (like LSP textDocument/documentHighlight): {"items": [...]}
  std::string document_highlights_json(std::string_view uri, uint32_t line, uint32_t character);

  // Document symbols (outline): {"items": [...]}
  std::string document_symbols_json(std::string_view uri);

  // Workspace symbols: {"items": [...]}
  std::string workspace_symbols_json(std::string_view query);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace frugal_ls::lsp
