// owncheck/basic/diagnostic.cpp - Diagnostic implementation
#include "owncheck/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace owncheck
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::DuplicateDeclaration:
      return "DuplicateDeclaration";
    case DiagnosticKind::UnknownOwnedType:
      return "UnknownOwnedType";
    case DiagnosticKind::UnknownMemberType:
      return "UnknownMemberType";
    case DiagnosticKind::UnannotatedOwnedType:
      return "UnannotatedOwnedType";
    case DiagnosticKind::UnexpectedReference:
      return "UnexpectedReference";
    case DiagnosticKind::DisjointOwnership:
      return "DisjointOwnership";
    case DiagnosticKind::RetainCycleViolation:
      return "RetainCycleViolation";
    case DiagnosticKind::ValueChainTooDeep:
      return "ValueChainTooDeep";
  }
  return "Unknown";
}

std::string_view code_of(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::DuplicateDeclaration:
      return "OWN001";
    case DiagnosticKind::UnknownOwnedType:
      return "OWN002";
    case DiagnosticKind::UnknownMemberType:
      return "OWN003";
    case DiagnosticKind::UnannotatedOwnedType:
      return "OWN004";
    case DiagnosticKind::UnexpectedReference:
      return "OWN005";
    case DiagnosticKind::DisjointOwnership:
      return "OWN006";
    case DiagnosticKind::RetainCycleViolation:
      return "OWN007";
    case DiagnosticKind::ValueChainTooDeep:
      return "OWN008";
  }
  return "OWN000";
}

Severity default_severity(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::UnannotatedOwnedType:
    case DiagnosticKind::ValueChainTooDeep:
      return Severity::Warning;
    default:
      return Severity::Error;
  }
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_related(std::string type_name)
{
  diagnostic_.related_type = std::move(type_name);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_member(std::string member_name)
{
  diagnostic_.member = std::move(member_name);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_severity(Severity severity)
{
  diagnostic_.severity = severity;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  DiagnosticKind kind, std::string subject, std::string message)
{
  Diagnostic d;
  d.kind = kind;
  d.severity = default_severity(kind);
  d.code = std::string(code_of(kind));
  d.subject_type = std::move(subject);
  d.message = std::move(message);
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::of_kind(DiagnosticKind kind) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [kind](const Diagnostic & d) { return d.kind == kind; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Error;
    }));
}

size_t DiagnosticBag::warning_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Warning;
    }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

void DiagnosticBag::sort()
{
  std::stable_sort(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & a, const Diagnostic & b) {
      if (a.subject_type != b.subject_type) {
        return a.subject_type < b.subject_type;
      }
      return static_cast<uint8_t>(a.kind) < static_cast<uint8_t>(b.kind);
    });
}

void DiagnosticBag::promote_warnings()
{
  for (auto & d : diagnostics_) {
    d.severity = Severity::Error;
  }
}

std::vector<Diagnostic> DiagnosticBag::take()
{
  std::vector<Diagnostic> out = std::move(diagnostics_);
  diagnostics_.clear();
  return out;
}

}  // namespace owncheck
