// owncheck/driver/checker.hpp - Check driver
//
// Single entry point for the check pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/model/type_decl.hpp"
#include "owncheck/project/project_config.hpp"

namespace owncheck
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Value chain depth limit (overrides project config)
  std::optional<size_t> max_value_chain_depth;

  /// Treat warnings as errors (combined with the project setting)
  bool warnings_as_errors = false;

  /// Enable verbose output on stderr
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  /// Whether the check succeeded (inputs loaded, no errors)
  bool success = false;

  /// Validator findings, sorted by subject type then kind
  DiagnosticBag diagnostics;

  /// Problems loading inputs (missing file, malformed YAML, ...)
  std::vector<std::string> input_errors;

  /// Number of declarations handed to the validator
  size_t declaration_count = 0;
};

// ============================================================================
// Checker
// ============================================================================

/**
 * Driver that orchestrates the check pipeline.
 *
 * The pipeline consists of:
 * 1. Loading the declaration set(s)
 * 2. Ownership validation
 * 3. Severity policy (warnings as errors)
 */
class Checker
{
public:
  /**
   * Check a single declaration file.
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Check every input of a project. All inputs form one declaration set, so
   * types may reference each other across files.
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

  /**
   * Check an in-memory declaration set.
   */
  [[nodiscard]] static CheckResult check_declarations(
    const std::vector<TypeDeclaration> & declarations, const CheckOptions & options,
    size_t max_value_chain_depth = k_default_max_value_chain_depth);

private:
  static void finish(CheckResult & result, bool warnings_as_errors);
};

}  // namespace owncheck
