// owncheck/sema/ownership_graph.cpp - Graph construction, Tarjan SCC, reachability

#include "owncheck/sema/ownership_graph.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <limits>
#include <string>
#include <unordered_set>

namespace owncheck
{

namespace
{

constexpr uint32_t k_unvisited = std::numeric_limits<uint32_t>::max();

struct TarjanState
{
  std::vector<uint32_t> index;
  std::vector<uint32_t> lowlink;
  std::vector<bool> on_stack;
  std::vector<NodeId> stack;
  uint32_t next_index = 0;
};

/// One pending strongconnect() call: the node and its next successor to visit.
struct TarjanFrame
{
  NodeId node;
  size_t next_succ;
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

void OwnershipGraph::build(const DeclTable & table, size_t max_value_chain_depth)
{
  nodes_.clear();
  node_index_.clear();
  adj_.clear();
  scc_of_.clear();
  scc_members_.clear();
  scc_succ_.clear();

  for (const auto * decl : table.all()) {
    if (!decl->is_reference()) continue;
    const auto id = static_cast<NodeId>(nodes_.size());
    nodes_.push_back(decl);
    node_index_.emplace(std::string_view(decl->name), id);
  }
  adj_.resize(nodes_.size());

  build_edges(table, max_value_chain_depth);
  compute_sccs();
  verify_partition();
  build_condensation();
}

void OwnershipGraph::add_edge(NodeId from, NodeId to)
{
  auto & out = adj_[from];
  if (std::find(out.begin(), out.end(), to) == out.end()) {
    out.push_back(to);
  }
}

void OwnershipGraph::build_edges(const DeclTable & table, size_t max_value_chain_depth)
{
  for (const auto * decl : table.all()) {
    if (!decl->is_annotated) continue;

    const auto self = node_of(decl->name);

    // The owns-list is a set; repeated entries are ignored.
    std::unordered_set<std::string_view> seen;

    for (const auto & entry : decl->owns_list) {
      if (!seen.insert(entry).second) continue;

      const TypeDeclaration * owned = table.find(entry);
      if (!owned) {
        if (diags_) {
          diags_
            ->report(
              DiagnosticKind::UnknownOwnedType, decl->name,
              fmt::format("'{}' lists unknown type '{}' in its owns-list", decl->name, entry))
            .with_related(entry)
            .with_help(fmt::format("declare '{}' or remove it from @owns", entry));
        }
        continue;
      }

      // Value declarations only describe what they carry; they are not nodes.
      if (!self) continue;

      if (owned->is_reference()) {
        add_edge(*self, *node_of(owned->name));
        continue;
      }

      walk_value_chain(table, *owned, max_value_chain_depth, [&](const ValueChainStep & step) {
        if (step.kind == ValueChainStep::Kind::Reference) {
          add_edge(*self, *node_of(step.decl->name));
        }
      });
    }
  }
}

// ============================================================================
// Strongly Connected Components
// ============================================================================

void OwnershipGraph::compute_sccs()
{
  const size_t n = nodes_.size();
  scc_of_.assign(n, k_unvisited);

  TarjanState st;
  st.index.assign(n, k_unvisited);
  st.lowlink.assign(n, 0);
  st.on_stack.assign(n, false);
  st.stack.reserve(n);

  std::vector<TarjanFrame> frames;

  const auto enter = [&](NodeId v) {
    st.index[v] = st.next_index;
    st.lowlink[v] = st.next_index;
    ++st.next_index;
    st.stack.push_back(v);
    st.on_stack[v] = true;
    frames.push_back(TarjanFrame{v, 0});
  };

  for (NodeId root = 0; root < static_cast<NodeId>(n); ++root) {
    if (st.index[root] != k_unvisited) continue;

    enter(root);
    while (!frames.empty()) {
      auto & frame = frames.back();
      const NodeId v = frame.node;

      if (frame.next_succ < adj_[v].size()) {
        const NodeId w = adj_[v][frame.next_succ++];
        if (st.index[w] == k_unvisited) {
          // `frame` is invalidated here; lowlink[v] is updated when w returns.
          enter(w);
        } else if (st.on_stack[w]) {
          st.lowlink[v] = std::min(st.lowlink[v], st.index[w]);
        }
        continue;
      }

      // All successors done: v returns to its caller.
      frames.pop_back();
      if (!frames.empty()) {
        const NodeId caller = frames.back().node;
        st.lowlink[caller] = std::min(st.lowlink[caller], st.lowlink[v]);
      }

      if (st.lowlink[v] != st.index[v]) continue;

      // v is the root of a component: pop it off the stack.
      const auto scc = static_cast<SccId>(scc_members_.size());
      std::vector<NodeId> members;
      NodeId w = 0;
      do {
        w = st.stack.back();
        st.stack.pop_back();
        st.on_stack[w] = false;
        scc_of_[w] = scc;
        members.push_back(w);
      } while (w != v);

      std::sort(members.begin(), members.end());
      scc_members_.push_back(std::move(members));
    }
  }
}

void OwnershipGraph::verify_partition() const
{
  size_t total = 0;
  for (SccId c = 0; c < static_cast<SccId>(scc_members_.size()); ++c) {
    if (scc_members_[c].empty()) {
      throw InternalError(fmt::format("ownership graph: component {} is empty", c));
    }
    for (const NodeId m : scc_members_[c]) {
      if (m >= nodes_.size() || scc_of_[m] != c) {
        throw InternalError(
          fmt::format("ownership graph: node {} is misassigned to component {}", m, c));
      }
    }
    total += scc_members_[c].size();
  }
  if (total != nodes_.size()) {
    throw InternalError(fmt::format(
      "ownership graph: components cover {} of {} nodes", total, nodes_.size()));
  }

  // Components are emitted in reverse topological order: an edge may only
  // lead to the same or an earlier component.
  for (NodeId v = 0; v < static_cast<NodeId>(nodes_.size()); ++v) {
    for (const NodeId w : adj_[v]) {
      if (scc_of_[w] > scc_of_[v]) {
        throw InternalError(fmt::format(
          "ownership graph: edge {} -> {} breaks component order", nodes_[v]->name,
          nodes_[w]->name));
      }
    }
  }
}

// ============================================================================
// Reachability
// ============================================================================

void OwnershipGraph::build_condensation()
{
  scc_succ_.assign(scc_members_.size(), {});

  for (NodeId v = 0; v < static_cast<NodeId>(nodes_.size()); ++v) {
    const SccId c = scc_of_[v];
    for (const NodeId w : adj_[v]) {
      if (scc_of_[w] != c) {
        scc_succ_[c].push_back(scc_of_[w]);
      }
    }
  }

  for (auto & out : scc_succ_) {
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
  }
}

std::vector<bool> OwnershipGraph::reachable_sccs(SccId scc, SccId floor) const
{
  // Indexed by (id - floor). Successor ids only decrease, so nothing below
  // `floor` is ever needed once it is passed.
  std::vector<bool> seen(scc - floor + 1, false);
  std::vector<SccId> work{scc};
  seen[scc - floor] = true;

  while (!work.empty()) {
    const SccId c = work.back();
    work.pop_back();
    for (const SccId d : scc_succ_[c]) {
      if (d < floor || seen[d - floor]) continue;
      seen[d - floor] = true;
      work.push_back(d);
    }
  }
  return seen;
}

size_t OwnershipGraph::edge_count() const noexcept
{
  size_t total = 0;
  for (const auto & out : adj_) {
    total += out.size();
  }
  return total;
}

std::optional<NodeId> OwnershipGraph::node_of(std::string_view name) const
{
  const auto it = node_index_.find(name);
  if (it == node_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

gsl::span<const NodeId> OwnershipGraph::successors(NodeId node) const
{
  const auto & out = adj_.at(node);
  return gsl::span<const NodeId>(out.data(), out.size());
}

bool OwnershipGraph::has_edge(NodeId from, NodeId to) const
{
  const auto & out = adj_.at(from);
  return std::find(out.begin(), out.end(), to) != out.end();
}

gsl::span<const NodeId> OwnershipGraph::scc_members(SccId scc) const
{
  const auto & members = scc_members_.at(scc);
  return gsl::span<const NodeId>(members.data(), members.size());
}

bool OwnershipGraph::reaches(NodeId from, NodeId to) const
{
  const SccId source = scc_of(from);
  const SccId target = scc_of(to);
  if (source == target) {
    return true;
  }
  if (source < target) {
    return false;
  }
  return reachable_sccs(source, target)[0];
}

std::vector<NodeId> OwnershipGraph::reachable_from(NodeId from) const
{
  const SccId source = scc_of(from);
  const auto seen = reachable_sccs(source);

  std::vector<NodeId> out;
  for (NodeId v = 0; v < static_cast<NodeId>(nodes_.size()); ++v) {
    if (scc_of_[v] <= source && seen[scc_of_[v]]) {
      out.push_back(v);
    }
  }
  return out;
}

std::optional<NodeId> OwnershipGraph::common_descendant(NodeId a, NodeId b) const
{
  const SccId sa = scc_of(a);
  const SccId sb = scc_of(b);
  const auto from_a = reachable_sccs(sa);
  const auto from_b = reachable_sccs(sb);

  for (NodeId v = 0; v < static_cast<NodeId>(nodes_.size()); ++v) {
    const SccId c = scc_of_[v];
    if (c <= sa && c <= sb && from_a[c] && from_b[c]) {
      return v;
    }
  }
  return std::nullopt;
}

}  // namespace owncheck
