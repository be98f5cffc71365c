// owncheck/project/project_config.hpp - Project configuration (owncheck.yaml)
//
// Parses and validates owncheck.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "owncheck/sema/value_chain.hpp"

namespace owncheck
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Check configuration section.
 */
struct CheckConfig
{
  /// Declaration files to validate (relative to owncheck.yaml)
  std::vector<std::filesystem::path> inputs;

  /// Nested value types followed before reporting ValueChainTooDeep
  size_t max_value_chain_depth = k_default_max_value_chain_depth;

  /// Treat warnings as errors
  bool warnings_as_errors = false;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (owncheck.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CheckConfig check;

  /// Directory containing owncheck.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

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
 * Load a project configuration from an owncheck.yaml file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find owncheck.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "owncheck.yaml";

}  // namespace owncheck
