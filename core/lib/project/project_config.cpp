// frugal_ls/project/project_config.cpp - Project configuration implementation
//
#include "frugal_ls/project/project_config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>

namespace frugal_ls
{

namespace
{

constexpr std::array<std::string_view, 7> k_log_levels = {
  "trace", "debug", "info", "warn", "error", "critical", "off",
};

/// Parse the 'files' section
bool parse_files(const YAML::Node & node, FilesConfig & out, std::string & error)
{
  if (!node["extensions"]) return true;

  const YAML::Node exts = node["extensions"];
  if (!exts.IsSequence()) {
    error = "files.extensions must be a list";
    return false;
  }

  std::vector<std::string> parsed;
  for (const auto & ext : exts) {
    auto value = ext.as<std::string>();
    if (value.empty()) {
      error = "files.extensions must not contain empty entries";
      return false;
    }
    parsed.push_back(std::move(value));
  }

  if (parsed.empty()) {
    error = "files.extensions must not be empty";
    return false;
  }

  out.extensions = std::move(parsed);
  return true;
}

/// Parse the 'diagnostics' section
bool parse_diagnostics(const YAML::Node & node, DiagnosticsOptions & out, std::string & error)
{
  if (node["naming_conventions"]) {
    out.naming_conventions = node["naming_conventions"].as<bool>();
  }
  if (node["type_references"]) {
    out.type_references = node["type_references"].as<bool>();
  }
  if (node["max_syntax_errors"]) {
    const auto cap = node["max_syntax_errors"].as<int64_t>();
    if (cap < 0) {
      error = "diagnostics.max_syntax_errors must not be negative";
      return false;
    }
    out.max_syntax_errors = static_cast<size_t>(cap);
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  try {
    if (root["files"] && !parse_files(root["files"], config.files, error)) {
      return ConfigLoadResult::fail(error);
    }

    if (root["diagnostics"] && !parse_diagnostics(root["diagnostics"], config.diagnostics, error)) {
      return ConfigLoadResult::fail(error);
    }

    if (root["logging"] && root["logging"]["level"]) {
      config.logging.level = root["logging"]["level"].as<std::string>();
      if (!is_valid_log_level(config.logging.level)) {
        return ConfigLoadResult::fail(
          "invalid logging.level: '" + config.logging.level + "'");
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

bool is_valid_log_level(std::string_view level) noexcept
{
  for (const auto name : k_log_levels) {
    if (name == level) return true;
  }
  return false;
}

ConfigLoadResult parse_project_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_root(root);
  if (result.success) {
    spdlog::debug("loaded configuration from {}", config_path.string());
  }
  return result;
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace frugal_ls
