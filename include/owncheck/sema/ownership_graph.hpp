// owncheck/sema/ownership_graph.hpp - Ownership graph, SCCs and reachability
//
// Nodes are the reference-type declarations of a DeclTable. An edge A -> B
// means A's owns-list permits A to hold B; value types named in an owns-list
// are flattened into edges to the reference types they may carry.
//
// Strongly connected components are computed with an iterative Tarjan's
// algorithm, so arbitrarily long ownership chains need no call stack depth.
// Tarjan completes components in reverse topological order: every edge of the
// condensation leads to a component with a smaller id. Reachability queries
// search the condensation on demand and never leave the id range between the
// two endpoints.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <gsl/span>

#include "owncheck/basic/diagnostic.hpp"
#include "owncheck/model/type_decl.hpp"
#include "owncheck/sema/decl_table.hpp"
#include "owncheck/sema/value_chain.hpp"

namespace owncheck
{

using NodeId = uint32_t;
using SccId = uint32_t;

class OwnershipGraph
{
public:
  explicit OwnershipGraph(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  // Non-copyable (node lookup refers into the declaration table)
  OwnershipGraph(const OwnershipGraph &) = delete;
  OwnershipGraph & operator=(const OwnershipGraph &) = delete;
  OwnershipGraph(OwnershipGraph &&) = default;
  OwnershipGraph & operator=(OwnershipGraph &&) = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Build nodes, edges, SCCs and the reachability closure from `table`.
   *
   * Owns-list entries naming unknown types are reported as UnknownOwnedType
   * (once per entry, for every annotated declaration) and produce no edge.
   *
   * @throws InternalError if the SCC partition comes out inconsistent
   */
  void build(const DeclTable & table, size_t max_value_chain_depth = k_default_max_value_chain_depth);

  // ===========================================================================
  // Nodes & Edges
  // ===========================================================================

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept;

  [[nodiscard]] std::optional<NodeId> node_of(std::string_view name) const;
  [[nodiscard]] const TypeDeclaration & decl(NodeId node) const { return *nodes_.at(node); }

  /// Direct successors in edge insertion order.
  [[nodiscard]] gsl::span<const NodeId> successors(NodeId node) const;

  /// True if the edge A -> B was declared (directly or through a value type).
  [[nodiscard]] bool has_edge(NodeId from, NodeId to) const;

  // ===========================================================================
  // Strongly Connected Components
  // ===========================================================================

  [[nodiscard]] size_t scc_count() const noexcept { return scc_members_.size(); }
  [[nodiscard]] SccId scc_of(NodeId node) const { return scc_of_.at(node); }

  /// Members of a component, sorted by declaration order.
  [[nodiscard]] gsl::span<const NodeId> scc_members(SccId scc) const;

  [[nodiscard]] bool in_same_scc(NodeId a, NodeId b) const { return scc_of(a) == scc_of(b); }

  // ===========================================================================
  // Reachability
  // ===========================================================================

  /**
   * True if `to` is reachable from `from`.
   *
   * Reflexive (every node reaches itself) and transitive; members of one SCC
   * reach each other.
   */
  [[nodiscard]] bool reaches(NodeId from, NodeId to) const;

  /// Every node reachable from `from` (itself included), in declaration order.
  [[nodiscard]] std::vector<NodeId> reachable_from(NodeId from) const;

  /**
   * A node reachable from both `a` and `b`, if any.
   *
   * Returns the first such node in declaration order.
   */
  [[nodiscard]] std::optional<NodeId> common_descendant(NodeId a, NodeId b) const;

private:
  void add_edge(NodeId from, NodeId to);
  void build_edges(const DeclTable & table, size_t max_value_chain_depth);
  void compute_sccs();
  void verify_partition() const;
  void build_condensation();

  /// Components reachable from `scc`, restricted to ids >= `floor`.
  [[nodiscard]] std::vector<bool> reachable_sccs(SccId scc, SccId floor = 0) const;

  DiagnosticBag * diags_ = nullptr;

  std::vector<const TypeDeclaration *> nodes_;
  std::unordered_map<std::string_view, NodeId> node_index_;
  std::vector<std::vector<NodeId>> adj_;

  std::vector<SccId> scc_of_;
  std::vector<std::vector<NodeId>> scc_members_;

  // Condensation edges, deduplicated; every target id is smaller than its source
  std::vector<std::vector<SccId>> scc_succ_;
};

}  // namespace owncheck
