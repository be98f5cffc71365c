// owncheck/sema/ownership_validator.cpp - @owns(...) validation

#include "owncheck/sema/ownership_validator.hpp"

#include <fmt/core.h>

#include <optional>
#include <set>
#include <string>
#include <utility>

#include "owncheck/sema/decl_table.hpp"
#include "owncheck/sema/ownership_graph.hpp"

namespace owncheck
{

namespace
{

/**
 * State for a single validation run.
 */
class ValidationPass
{
public:
  ValidationPass(const ValidatorOptions & options, DiagnosticBag & diags)
  : options_(options), diags_(diags), table_(&diags), graph_(&diags)
  {
  }

  void run(gsl::span<const TypeDeclaration> declarations)
  {
    table_.build(declarations);
    graph_.build(table_, options_.max_value_chain_depth);

    for (const auto * decl : table_.all()) {
      if (decl->is_reference() && decl->is_annotated) {
        check_members(*decl);
      }
    }

    check_cycles();
  }

private:
  // ===========================================================================
  // Stored members
  // ===========================================================================

  void check_members(const TypeDeclaration & owner)
  {
    reported_.clear();

    for (const auto & member : owner.stored_members) {
      const TypeDeclaration * type = table_.find(member.type);
      if (!type) {
        report_once(
          DiagnosticKind::UnknownMemberType, owner, member.type, member.name,
          fmt::format(
            "'{}' stores member '{}' of unknown type '{}'", owner.name, member.name, member.type),
          "declare the type or fix the member's type name");
        continue;
      }

      if (type->is_reference()) {
        check_reference(owner, member.name, *type, member.via_value_type_chain);
        continue;
      }

      check_value(owner, member.name, *type);
    }
  }

  void check_reference(
    const TypeDeclaration & owner, const std::string & member, const TypeDeclaration & type,
    bool via_value_chain)
  {
    const char * how = via_value_chain ? " through a value type" : "";

    if (!type.is_annotated) {
      report_once(
        DiagnosticKind::UnannotatedOwnedType, owner, type.name, member,
        fmt::format(
          "'{}' stores unannotated type '{}'{}; the dependency is unchecked", owner.name,
          type.name, how),
        fmt::format("annotate '{}' with @owns(...)", type.name));
      return;
    }

    const NodeId from = *graph_.node_of(owner.name);
    const NodeId to = *graph_.node_of(type.name);
    if (graph_.reaches(from, to)) {
      return;
    }

    if (graph_.reaches(to, from)) {
      report_once(
        DiagnosticKind::UnexpectedReference, owner, type.name, member,
        fmt::format(
          "'{}' stores '{}'{} but does not own it ('{}' owns '{}' instead)", owner.name,
          type.name, how, type.name, owner.name),
        fmt::format("add '{}' to the owns-list of '{}'", type.name, owner.name));
      return;
    }

    // Related through a type both sides own, but not in the stored direction.
    if (const auto shared = graph_.common_descendant(from, to)) {
      report_once(
        DiagnosticKind::UnexpectedReference, owner, type.name, member,
        fmt::format(
          "'{}' stores '{}'{} but does not own it (both only own '{}')", owner.name, type.name,
          how, graph_.decl(*shared).name),
        fmt::format("add '{}' to the owns-list of '{}'", type.name, owner.name));
      return;
    }

    report_once(
      DiagnosticKind::DisjointOwnership, owner, type.name, member,
      fmt::format(
        "'{}' stores '{}'{} but no ownership relation connects them", owner.name, type.name,
        how),
      fmt::format("add '{}' to the owns-list of '{}'", type.name, owner.name));
  }

  void check_value(const TypeDeclaration & owner, const std::string & member, const TypeDeclaration & value)
  {
    walk_value_chain(
      table_, value, options_.max_value_chain_depth, [&](const ValueChainStep & step) {
        switch (step.kind) {
          case ValueChainStep::Kind::Reference:
            check_reference(owner, member, *step.decl, true);
            break;
          case ValueChainStep::Kind::UnannotatedValue:
            report_once(
              DiagnosticKind::UnannotatedOwnedType, owner, step.decl->name, member,
              fmt::format(
                "'{}' stores unannotated value type '{}', which may carry any reference",
                owner.name, step.decl->name),
              fmt::format("annotate '{}' with @owns(...)", step.decl->name));
            break;
          case ValueChainStep::Kind::DepthExceeded:
            report_once(
              DiagnosticKind::ValueChainTooDeep, owner, step.decl->name, member,
              fmt::format(
                "value type chain below '{}' is nested deeper than {}; '{}' is not checked",
                owner.name, options_.max_value_chain_depth, step.decl->name));
            break;
        }
      });
  }

  /// Report (kind, related) at most once per owner.
  void report_once(
    DiagnosticKind kind, const TypeDeclaration & owner, const std::string & related,
    const std::string & member, std::string message, std::optional<std::string> help = {})
  {
    if (!reported_.emplace(kind, related).second) {
      return;
    }

    auto builder = diags_.report(kind, owner.name, std::move(message));
    builder.with_related(related).with_member(member);
    if (help) {
      builder.with_help(std::move(*help));
    }
  }

  // ===========================================================================
  // Ownership cycles
  // ===========================================================================

  void check_cycles()
  {
    for (SccId c = 0; c < static_cast<SccId>(graph_.scc_count()); ++c) {
      const auto members = graph_.scc_members(c);
      if (members.size() < 2) continue;
      check_cycle(members);
    }
  }

  void check_cycle(gsl::span<const NodeId> members)
  {
    for (const NodeId m : members) {
      std::optional<NodeId> missing;
      for (const NodeId n : members) {
        if (!graph_.has_edge(m, n)) {
          if (n == m) {
            missing = m;
            continue;
          }
          missing = n;
          break;
        }
      }
      if (!missing) continue;

      // Name the pair: the first member M fails to list, or (if it only
      // omits itself) the first other member it does list.
      NodeId partner = *missing;
      if (partner == m) {
        for (const NodeId n : members) {
          if (n != m && graph_.has_edge(m, n)) {
            partner = n;
            break;
          }
        }
      }

      report_cycle(members, m, partner);
      return;
    }
  }

  void report_cycle(gsl::span<const NodeId> members, NodeId insufficient, NodeId partner)
  {
    const auto & m = graph_.decl(insufficient);
    const auto & n = graph_.decl(partner);

    std::string cluster;
    for (const NodeId id : members) {
      if (!cluster.empty()) cluster += ", ";
      cluster += graph_.decl(id).name;
    }

    std::string detail;
    if (graph_.has_edge(insufficient, partner)) {
      detail = fmt::format("'{}' does not list itself", m.name);
    } else {
      detail = fmt::format("'{}' does not list '{}'", m.name, n.name);
    }
    const std::string help =
      fmt::format("list every member of the cycle in each owns-list: @owns({})", cluster);

    if (const auto outer = find_outer_holder(members)) {
      diags_
        .report(
          DiagnosticKind::RetainCycleViolation, outer->first->name,
          fmt::format(
            "'{}' stores '{}', which is part of a partially declared ownership cycle between "
            "'{}' and '{}': {}",
            outer->first->name, outer->second, m.name, n.name, detail))
        .with_related(outer->second)
        .with_help(help);
      return;
    }

    diags_
      .report(
        DiagnosticKind::RetainCycleViolation, m.name,
        fmt::format(
          "ownership cycle between '{}' and '{}' is only partially declared: {}", m.name,
          n.name, detail))
      .with_related(n.name)
      .with_help(help);
  }

  /**
   * First reference declaration outside the cycle that stores one of its
   * members (directly or through a value type), with the stored type name.
   */
  std::optional<std::pair<const TypeDeclaration *, std::string>> find_outer_holder(
    gsl::span<const NodeId> members) const
  {
    const SccId cycle = graph_.scc_of(members[0]);
    const auto in_cycle = [&](const TypeDeclaration & type) {
      const auto node = graph_.node_of(type.name);
      return node && graph_.scc_of(*node) == cycle;
    };

    for (const auto * decl : table_.all()) {
      if (!decl->is_reference() || in_cycle(*decl)) continue;

      for (const auto & member : decl->stored_members) {
        const TypeDeclaration * type = table_.find(member.type);
        if (!type) continue;

        if (type->is_reference()) {
          if (in_cycle(*type)) {
            return std::make_pair(decl, type->name);
          }
          continue;
        }

        std::optional<std::string> carried;
        walk_value_chain(
          table_, *type, options_.max_value_chain_depth, [&](const ValueChainStep & step) {
            if (!carried && step.kind == ValueChainStep::Kind::Reference && in_cycle(*step.decl)) {
              carried = step.decl->name;
            }
          });
        if (carried) {
          return std::make_pair(decl, *carried);
        }
      }
    }
    return std::nullopt;
  }

  const ValidatorOptions & options_;
  DiagnosticBag & diags_;
  DeclTable table_;
  OwnershipGraph graph_;

  std::set<std::pair<DiagnosticKind, std::string>> reported_;
};

}  // namespace

std::vector<Diagnostic> OwnershipValidator::validate(
  gsl::span<const TypeDeclaration> declarations) const
{
  DiagnosticBag diags;
  ValidationPass pass(options_, diags);
  pass.run(declarations);
  diags.sort();
  return diags.take();
}

bool OwnershipValidator::validate(
  gsl::span<const TypeDeclaration> declarations, DiagnosticBag & diags) const
{
  DiagnosticBag local;
  ValidationPass pass(options_, local);
  pass.run(declarations);
  local.sort();

  const bool ok = !local.has_errors();
  diags.merge(std::move(local));
  return ok;
}

std::vector<Diagnostic> validate(const std::vector<TypeDeclaration> & declarations)
{
  return OwnershipValidator{}.validate(declarations);
}

}  // namespace owncheck
