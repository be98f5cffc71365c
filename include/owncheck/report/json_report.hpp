// owncheck/report/json_report.hpp - JSON serialization of validation output
//
// Machine-readable counterparts of the text output, returning nlohmann::json
// objects for diagnostics and for the ownership graph.
//
#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/sema/ownership_graph.hpp"

namespace owncheck
{

/**
 * Serialize a single diagnostic.
 *
 * Keys: severity, kind, code, subject, related, member, message, help
 * (absent optional fields are null).
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/**
 * Serialize a diagnostic list with an error/warning summary.
 */
[[nodiscard]] nlohmann::json to_json(const std::vector<Diagnostic> & diags);

/**
 * Serialize the ownership graph: nodes (declaration order), edges and the
 * strongly connected components.
 */
[[nodiscard]] nlohmann::json to_json(const OwnershipGraph & graph);

}  // namespace owncheck
