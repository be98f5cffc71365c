// owncheck/report/json_report.cpp - JSON serialization implementation
//
#include "owncheck/report/json_report.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace owncheck
{
namespace
{

using nlohmann::json;

json j_optional(const std::optional<std::string> & value)
{
  if (!value) return nullptr;
  return *value;
}

}  // namespace

json to_json(const Diagnostic & diag)
{
  return json{
    {"severity", std::string(to_string(diag.severity))},
    {"kind", std::string(to_string(diag.kind))},
    {"code", diag.code},
    {"subject", diag.subject_type},
    {"related", j_optional(diag.related_type)},
    {"member", j_optional(diag.member)},
    {"message", diag.message},
    {"help", j_optional(diag.help_message)}};
}

json to_json(const std::vector<Diagnostic> & diags)
{
  json list = json::array();
  size_t errors = 0;
  size_t warnings = 0;
  for (const auto & d : diags) {
    list.push_back(to_json(d));
    if (d.severity == Severity::Error) {
      ++errors;
    } else {
      ++warnings;
    }
  }

  return json{
    {"diagnostics", std::move(list)},
    {"summary", json{{"errors", errors}, {"warnings", warnings}}}};
}

json to_json(const OwnershipGraph & graph)
{
  json nodes = json::array();
  json edges = json::array();
  for (NodeId v = 0; v < static_cast<NodeId>(graph.node_count()); ++v) {
    const auto & decl = graph.decl(v);
    nodes.push_back(json{
      {"name", decl.name}, {"annotated", decl.is_annotated}, {"scc", graph.scc_of(v)}});

    for (const NodeId w : graph.successors(v)) {
      edges.push_back(json{{"from", decl.name}, {"to", graph.decl(w).name}});
    }
  }

  json sccs = json::array();
  for (SccId c = 0; c < static_cast<SccId>(graph.scc_count()); ++c) {
    json members = json::array();
    for (const NodeId m : graph.scc_members(c)) {
      members.push_back(graph.decl(m).name);
    }
    sccs.push_back(std::move(members));
  }

  return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}, {"sccs", std::move(sccs)}};
}

}  // namespace owncheck
