// frugal_ls/lsp/rename_provider.hpp - Rename validation and edit construction
#pragma once

#include <string>
#include <string_view>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp/lsp_types.hpp"
#include "frugal_ls/lsp/reference_finder.hpp"

namespace frugal_ls::lsp
{

// ============================================================================
// Result Types
// ============================================================================

/// Outcome of validating a proposed identifier.
struct NameCheck
{
  bool success = false;
  std::string error;

  static NameCheck ok()
  {
    NameCheck r;
    r.success = true;
    return r;
  }

  static NameCheck fail(std::string msg)
  {
    NameCheck r;
    r.error = std::move(msg);
    return r;
  }
};

struct PrepareRenameResult
{
  Range range;              ///< only valid if success == true
  std::string placeholder;  ///< current name
  bool success = false;
  std::string error;

  static PrepareRenameResult ok(Range range, std::string placeholder)
  {
    PrepareRenameResult r;
    r.range = range;
    r.placeholder = std::move(placeholder);
    r.success = true;
    return r;
  }

  static PrepareRenameResult fail(std::string msg)
  {
    PrepareRenameResult r;
    r.error = std::move(msg);
    return r;
  }
};

struct RenameResult
{
  WorkspaceEdit edit;  ///< only valid if success == true
  bool success = false;
  std::string error;

  static RenameResult ok(WorkspaceEdit edit)
  {
    RenameResult r;
    r.edit = std::move(edit);
    r.success = true;
    return r;
  }

  static RenameResult fail(std::string msg)
  {
    RenameResult r;
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// RenameProvider
// ============================================================================

class RenameProvider
{
public:
  /**
   * Validate a replacement identifier.
   *
   * Rejects empty or whitespace-only names, anything not matching
   * [A-Za-z_][A-Za-z0-9_]* (ASCII only), reserved keywords and builtin type
   * names.
   */
  [[nodiscard]] static NameCheck validate_new_name(std::string_view name);

  /// False for builtin type names and keywords; every user name is renameable.
  [[nodiscard]] static bool is_renameable(std::string_view name) noexcept;

  /// Range and current text of the renameable symbol under `pos`.
  [[nodiscard]] PrepareRenameResult prepare_rename(const Document & doc, Position pos) const;

  /**
   * Rename every textual occurrence of the symbol under `pos` across `doc`
   * and `docs`, declaration included.
   */
  [[nodiscard]] RenameResult rename(
    const Document & doc, Position pos, std::string_view new_name,
    const DocumentSet & docs) const;

private:
  ReferenceFinder references_;
};

}  // namespace frugal_ls::lsp
