// owncheck/model/decl_loader.hpp - Declaration set loading (YAML)
//
// Reads the declaration set a front end extracted from source. The format is:
//
//   declarations:
//     - name: A
//       kind: reference          # reference | value
//       owns: [B]                # key present => annotated
//       members:
//         - { name: b, type: B }
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "owncheck/model/type_decl.hpp"

namespace owncheck
{

/**
 * Result of loading a declaration set.
 */
struct DeclLoadResult
{
  /// Loaded declarations in document order (only valid if success == true)
  std::vector<TypeDeclaration> declarations;

  bool success = false;

  std::string error;

  static DeclLoadResult ok(std::vector<TypeDeclaration> decls)
  {
    DeclLoadResult r;
    r.declarations = std::move(decls);
    r.success = true;
    return r;
  }

  static DeclLoadResult fail(std::string msg)
  {
    DeclLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse a declaration set from YAML text.
 *
 * Duplicate names are kept; reporting them is the validator's job.
 */
[[nodiscard]] DeclLoadResult parse_declarations(const std::string & yaml_text);

/**
 * Load a declaration set from a YAML file.
 */
[[nodiscard]] DeclLoadResult load_declarations(const std::filesystem::path & path);

}  // namespace owncheck
