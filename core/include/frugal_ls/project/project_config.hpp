// frugal_ls/project/project_config.hpp - Project configuration (frugal-ls.yaml)
//
// Parses and validates frugal-ls.yaml. Shared by the CLI and the Workspace
// facade.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/sema/diagnostics_engine.hpp"

namespace frugal_ls
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Which files count as Frugal sources.
 */
struct FilesConfig
{
  /// Suffixes of analyzable files; never empty after a successful load
  std::vector<std::string> extensions = default_file_extensions();
};

struct LoggingConfig
{
  /// spdlog level name: trace, debug, info, warn, error, critical or off
  std::string level = "warn";
};

/**
 * Complete project configuration (frugal-ls.yaml).
 */
struct ProjectConfig
{
  FilesConfig files;
  DiagnosticsOptions diagnostics;
  LoggingConfig logging;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a frugal-ls.yaml file.
 *
 * Missing sections and keys keep their defaults. Values of the wrong type
 * fail the load with a message naming the key.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml_text);

/**
 * Find frugal-ls.yaml by searching upward from `start_dir` until the
 * filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// True for the level names accepted by `logging.level`.
[[nodiscard]] bool is_valid_log_level(std::string_view level) noexcept;

inline constexpr const char * k_project_config_file_name = "frugal-ls.yaml";

}  // namespace frugal_ls
